// =============================================================================
// Mirador - Session Controller
// =============================================================================
// Drives one scrcpy mirroring session:
//   fetch server -> push -> probe encoders -> push again -> start client
// then routes client events to the decoder binding and local input to the
// client. The server deletes its jar when it exits, so the encoder probe run
// consumes the first push and the jar is pushed a second time before the real
// start.
//
// Threading:
//   start()/startAsync()  blocking sequence on the calling (or async) thread
//   stop()                any thread; cancels an in-flight start
//   pollEvents()          owner's control loop; applies client events in
//                         arrival order (decoder calls happen here)
//   handlePointer/Key     any UI thread
// =============================================================================
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../event_bus.hpp"
#include "../input/input_mapper.hpp"
#include "../result.hpp"
#include "../scrcpy_client.hpp"
#include "../speed_tracker.hpp"
#include "../video/decoder_binding.hpp"
#include "session_config.hpp"
#include "session_state.hpp"

namespace mirador {

// What the "Connecting..." dialog shows
struct DeploymentProgress {
    TransferProgress download;
    TransferProgress upload;
    bool push_step_visible = false;    // download finished
    bool start_step_visible = false;   // upload finished
    std::string download_text;
    std::string upload_text;
};

class SessionController {
public:
    struct EncoderChoice {
        std::string effective;
        bool substituted = false;
    };

    explicit SessionController(ScrcpyBackend backend,
                               ServerFetcher fetch_server,
                               EventBus& events = bus());
    ~SessionController();

    // Non-copyable
    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Only from Idle. On failure everything acquired so far is released and
    // the state is back to Idle before the error is returned.
    Result<void, SessionError> start(SessionConfig config);
    std::future<Result<void, SessionError>> startAsync(SessionConfig config);

    // No-op from Idle/Stopping. While a start is in flight: cancels it and
    // waits for it to unwind (unless called from the starting thread itself).
    Result<void, SessionError> stop();

    // Applies queued client events in arrival order. Returns events handled.
    size_t pollEvents();

    // --- Input (dropped unless Running) ---
    // Returns the pointer-capture action to apply when a touch was sent
    std::optional<input::PointerCapture> handlePointer(const input::PointerEvent& event,
                                                       const input::SurfaceBounds& bounds);
    bool handleKey(const std::string& key);
    bool pressNavButton(input::NavButton button);

    // --- Render surface ---
    // Surface for `decoder`, rebuilt when the decoder kind changes. Idle only.
    Result<std::shared_ptr<video::RenderSurface>, SessionError> prepareSurface(
        const video::DecoderDescriptor& decoder);
    std::shared_ptr<video::RenderSurface> surface() const;

    // --- State ---
    SessionState state() const;
    bool running() const { return state() == SessionState::Running; }
    std::optional<input::StreamSize> streamSize() const;
    std::vector<std::string> availableEncoders() const;
    std::string effectiveEncoder() const;

    TransferProgress downloadProgress() const;
    TransferProgress uploadProgress() const;
    DeploymentProgress deploymentProgress() const;

    // Probe result is authoritative: a preferred encoder it does not list is
    // replaced by the first entry. `available` must not be empty.
    static EncoderChoice chooseEncoder(const std::vector<std::string>& available,
                                       const std::string& preferred);

private:
    class ClientHandle;

    struct QueuedEvent {
        uint64_t generation = 0;
        ClientEvent event;
    };

    // Resources acquired by an in-flight start(), released on failure
    struct StartResources {
        std::shared_ptr<ClientHandle> client;
        std::shared_ptr<video::DecoderBinding> binding;
    };

    Result<void, SessionError> runStartSequence(const SessionConfig& config,
                                                uint64_t generation,
                                                StartResources& res);
    Result<void, SessionError> advance(SessionState next);
    void unwindStart(StartResources& res);
    void teardownRunning(std::unique_lock<std::mutex>& lock);
    // Tears down only if session `generation` is still the one running
    bool teardownIfCurrent(uint64_t generation);

    void enqueue(uint64_t generation, ClientEvent event);
    void clearQueue();
    // false when the event must wait for Running
    bool dispatch(ClientEvent& event, SessionState state, uint64_t generation);

    void publishState(SessionState old_state, SessionState new_state);
    void publishError(const SessionError& error);
    void publishProgress(TransferProgressEvent::Phase phase);
    void resetProgress();

    ScrcpyBackend backend_;
    ServerFetcher fetch_server_;
    EventBus& events_;

    // Session state
    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    SessionState state_ = SessionState::Idle;
    uint64_t generation_ = 0;              // bumped per session and on teardown
    bool stop_requested_ = false;
    std::thread::id start_thread_;
    std::shared_ptr<ClientHandle> pending_client_;   // client being started
    std::shared_ptr<ClientHandle> client_;           // Running only
    std::shared_ptr<video::DecoderBinding> binding_; // Running only
    std::optional<input::StreamSize> stream_size_;
    std::vector<std::string> encoders_;
    std::string effective_encoder_;
    std::string device_serial_;
    video::DecoderSlot slot_;

    // Client events
    std::mutex queue_mutex_;
    std::deque<QueuedEvent> queue_;

    // Transfer progress
    mutable std::mutex progress_mutex_;
    SpeedTracker download_;
    SpeedTracker upload_;
};

} // namespace mirador
