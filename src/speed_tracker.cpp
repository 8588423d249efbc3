#include "speed_tracker.hpp"
#include <cstdio>

namespace mirador {

SpeedTracker::SpeedTracker(std::chrono::milliseconds interval)
    : interval_(interval) {}

void SpeedTracker::update(uint64_t transferred, uint64_t total) {
    update(transferred, total, Clock::now());
}

void SpeedTracker::update(uint64_t transferred, uint64_t total, Clock::time_point now) {
    total_ = total;

    // First sample, or the transfer restarted from a lower offset
    if (!started_ || transferred < transferred_) {
        restartWindow(transferred, now);
        return;
    }

    transferred_ = transferred;

    // Finished: show the final count without waiting for the next interval
    if (total_ != 0 && transferred_ >= total_) {
        debounced_ = transferred_;
        return;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(now - last_refresh_);
    if (elapsed < interval_ || elapsed.count() <= 0) return;

    double elapsed_sec = elapsed.count() / 1000000.0;
    speed_ = static_cast<double>(transferred_ - debounced_) / elapsed_sec;
    has_speed_ = true;
    debounced_ = transferred_;
    last_refresh_ = now;
}

TransferProgress SpeedTracker::progress() const {
    TransferProgress p;
    p.transferred = transferred_;
    p.total = total_;
    p.debounced_transferred = debounced_;
    if (has_speed_ && total_ != 0 && transferred_ != total_) {
        p.speed = speed_;
    }
    return p;
}

void SpeedTracker::reset() {
    transferred_ = 0;
    total_ = 0;
    debounced_ = 0;
    speed_ = 0.0;
    has_speed_ = false;
    started_ = false;
    last_refresh_ = Clock::time_point{};
}

void SpeedTracker::restartWindow(uint64_t transferred, Clock::time_point now) {
    started_ = true;
    transferred_ = transferred;
    debounced_ = transferred;
    speed_ = 0.0;
    has_speed_ = false;
    last_refresh_ = now;
}

std::string formatSize(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        unit++;
    }
    char buf[32];
    if (unit == 0) {
        snprintf(buf, sizeof(buf), "%llu B", (unsigned long long)bytes);
    } else {
        snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    }
    return buf;
}

std::string formatSpeed(uint64_t completed, uint64_t total, std::optional<double> speed) {
    if (total == 0) return "";
    std::string text = formatSize(completed) + " of " + formatSize(total);
    if (speed && *speed >= 0.0) {
        text += " (" + formatSize(static_cast<uint64_t>(*speed)) + "/s)";
    }
    return text;
}

} // namespace mirador
