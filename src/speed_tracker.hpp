#pragma once
#include <cstdint>

#include <chrono>
#include <optional>
#include <string>

namespace mirador {

/**
 * Snapshot of one byte-counted transfer (server download or push).
 * total == 0 means the size is not known yet.
 */
struct TransferProgress {
    uint64_t transferred = 0;
    uint64_t total = 0;
    uint64_t debounced_transferred = 0;   // rate-limited view for display
    std::optional<double> speed;          // bytes/s, nullopt when not meaningful

    bool complete() const { return total != 0 && transferred >= total; }
};

/**
 * Turns a non-decreasing byte counter into a debounced counter and a
 * throughput estimate.
 *
 * The debounced counter is refreshed at most once per interval, and at once
 * when the transfer completes. Speed is the change of the debounced counter
 * divided by the wall-clock time between two refreshes. A counter lower than the last observation starts a new window.
 *
 * Not thread-safe; the owner serializes updates.
 */
class SpeedTracker {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr int DEFAULT_INTERVAL_MS = 1000;

    explicit SpeedTracker(std::chrono::milliseconds interval =
                              std::chrono::milliseconds(DEFAULT_INTERVAL_MS));

    void update(uint64_t transferred, uint64_t total);
    void update(uint64_t transferred, uint64_t total, Clock::time_point now);

    TransferProgress progress() const;

    void reset();

private:
    void restartWindow(uint64_t transferred, Clock::time_point now);

    std::chrono::milliseconds interval_;

    uint64_t transferred_ = 0;
    uint64_t total_ = 0;
    uint64_t debounced_ = 0;
    double speed_ = 0.0;
    bool has_speed_ = false;
    bool started_ = false;

    Clock::time_point last_refresh_{};
};

// "1.5 MB" style size, 1024-based units
std::string formatSize(uint64_t bytes);

// "1.0 MB of 2.0 MB (512.0 KB/s)"; empty when the total is unknown
std::string formatSpeed(uint64_t completed, uint64_t total, std::optional<double> speed);

} // namespace mirador
