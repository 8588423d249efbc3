#include "session_controller.hpp"

#include <algorithm>
#include <iterator>

#include "../mirador_log.hpp"

namespace mirador {

static constexpr const char* TAG = "session";

// =============================================================================
// ClientHandle - closes the client exactly once, drops input afterwards
// =============================================================================
class SessionController::ClientHandle {
public:
    explicit ClientHandle(std::unique_ptr<ScrcpyClient> client) : client_(std::move(client)) {}

    ScrcpyClient& client() { return *client_; }

    Result<void, Error> close() {
        if (closed_.exchange(true)) return {};
        return client_->close();
    }

    bool closed() const { return closed_.load(); }

    void injectTouch(const scrcpy::TouchCommand& cmd) {
        if (!closed()) client_->injectTouch(cmd);
    }
    void injectKeyCode(const scrcpy::KeyCodeCommand& cmd) {
        if (!closed()) client_->injectKeyCode(cmd);
    }
    void injectText(const std::string& text) {
        if (!closed()) client_->injectText(text);
    }
    void pressBackOrTurnOnScreen() {
        if (!closed()) client_->pressBackOrTurnOnScreen();
    }

private:
    std::unique_ptr<ScrcpyClient> client_;
    std::atomic<bool> closed_{false};
};

// =============================================================================
// Construction
// =============================================================================

SessionController::SessionController(ScrcpyBackend backend,
                                     ServerFetcher fetch_server,
                                     EventBus& events)
    : backend_(std::move(backend)),
      fetch_server_(std::move(fetch_server)),
      events_(events) {}

SessionController::~SessionController() {
    auto result = stop();
    if (result.is_err()) {
        MLOG_ERROR(TAG, "stop on destruction failed: %s", result.error().message.c_str());
    }
}

// =============================================================================
// Start
// =============================================================================

Result<void, SessionError> SessionController::start(SessionConfig config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Idle) {
            MLOG_WARN(TAG, "start() ignored in state %s", sessionStateToString(state_));
            return SessionError::invalidState(
                std::string("Cannot start a session while ") + sessionStateToString(state_));
        }
    }

    if (!config.decoder) {
        SessionError err = SessionError::decoderUnavailable("No available decoder");
        publishError(err);
        return err;
    }
    if (!config.device) {
        SessionError err = SessionError::deployment("No device selected");
        publishError(err);
        return err;
    }
    if (!fetch_server_ || !backend_.get_encoders || !backend_.create_client) {
        SessionError err = SessionError::deployment("scrcpy backend is not configured");
        publishError(err);
        return err;
    }

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Idle) {
            return SessionError::invalidState(
                std::string("Cannot start a session while ") + sessionStateToString(state_));
        }
        stop_requested_ = false;
        start_thread_ = std::this_thread::get_id();
        generation = ++generation_;
        device_serial_ = config.device->serial();
        // Decoder kind may only change the surface while Idle
        slot_.ensure(*config.decoder);
        state_ = SessionState::FetchingServer;
    }
    clearQueue();
    resetProgress();
    publishState(SessionState::Idle, SessionState::FetchingServer);

    MLOG_INFO(TAG, "Starting session on %s (decoder=%s, max_size=%d, bit_rate=%d, forward=%d)",
              device_serial_.c_str(), config.decoder->name.c_str(),
              config.max_size, config.bit_rate, config.tunnel_forward ? 1 : 0);

    StartResources res;
    auto result = runStartSequence(config, generation, res);

    if (result.is_ok()) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_requested_) {
            result = SessionError::cancelled("Session start cancelled");
        } else {
            client_ = res.client;
            binding_ = res.binding;
            pending_client_.reset();
            state_ = SessionState::Running;
            lock.unlock();
            publishState(SessionState::Starting, SessionState::Running);
            MLOG_INFO(TAG, "Session running on %s (encoder=%s)",
                      device_serial_.c_str(), effectiveEncoder().c_str());
            return result;
        }
    }

    SessionError err = result.error();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // A failure caused by stop() aborting the handshake is a cancellation
        if (stop_requested_) {
            err = SessionError::cancelled("Session start cancelled");
        }
    }
    unwindStart(res);

    if (err.kind == SessionError::Kind::Cancelled) {
        MLOG_INFO(TAG, "Start cancelled");
    } else {
        MLOG_ERROR(TAG, "Start failed (%s): %s", kindName(err.kind), err.message.c_str());
        publishError(err);
    }
    return err;
}

std::future<Result<void, SessionError>> SessionController::startAsync(SessionConfig config) {
    return std::async(std::launch::async, [this, config = std::move(config)]() mutable {
        return start(std::move(config));
    });
}

Result<void, SessionError> SessionController::runStartSequence(const SessionConfig& config,
                                                               uint64_t generation,
                                                               StartResources& res) {
    // 1. Download the server binary
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) {
            return SessionError::cancelled("Session start cancelled");
        }
    }
    auto fetched = fetch_server_([this](uint64_t downloaded, uint64_t total) {
        {
            std::lock_guard<std::mutex> lock(progress_mutex_);
            download_.update(downloaded, total);
        }
        publishProgress(TransferProgressEvent::Phase::Download);
    });
    if (fetched.is_err()) {
        return SessionError::deployment("Failed to download scrcpy server: " + fetched.error().message);
    }
    const std::vector<uint8_t> server = std::move(fetched).value();
    const uint64_t server_size = server.size();

    // 2. Push it to the device
    {
        auto step = advance(SessionState::DeployingServer);
        if (step.is_err()) return step;
    }
    auto sync_result = config.device->sync();
    if (sync_result.is_err()) {
        return SessionError::deployment("Failed to open sync channel: " + sync_result.error().message);
    }
    std::unique_ptr<AdbSync> sync = std::move(sync_result).value();
    if (!sync) {
        return SessionError::deployment("Device returned no sync channel");
    }

    auto pushed = sync->write(config.server_path, server, [this, server_size](uint64_t uploaded) {
        {
            std::lock_guard<std::mutex> lock(progress_mutex_);
            upload_.update(uploaded, server_size);
        }
        publishProgress(TransferProgressEvent::Phase::Upload);
    });
    if (pushed.is_err()) {
        return SessionError::deployment("Failed to push scrcpy server: " + pushed.error().message);
    }
    MLOG_INFO(TAG, "Pushed %s (%llu bytes)", config.server_path.c_str(),
              (unsigned long long)server_size);

    // 3. Ask the server which encoders exist
    {
        auto step = advance(SessionState::NegotiatingEncoder);
        if (step.is_err()) return step;
    }
    auto probed = backend_.get_encoders(makeClientOptions(config, ""));
    if (probed.is_err()) {
        return SessionError::negotiation("Encoder probe failed: " + probed.error().message);
    }
    std::vector<std::string> encoders = std::move(probed).value();
    if (encoders.empty()) {
        return SessionError::negotiation("No available encoder found");
    }

    EncoderChoice choice = chooseEncoder(encoders, config.encoder);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        encoders_ = encoders;
        effective_encoder_ = choice.effective;
    }
    if (choice.substituted) {
        MLOG_WARN(TAG, "Encoder '%s' not offered by device, using '%s'",
                  config.encoder.c_str(), choice.effective.c_str());
    }
    {
        EncoderSelectedEvent ev;
        ev.available = encoders;
        ev.requested = config.encoder;
        ev.effective = choice.effective;
        ev.substituted = choice.substituted;
        events_.publish(ev);
    }

    // 4. The probe run deleted the jar; push again, bind the decoder, start
    {
        auto step = advance(SessionState::Starting);
        if (step.is_err()) return step;
    }
    auto repushed = sync->write(config.server_path, server, nullptr);
    if (repushed.is_err()) {
        return SessionError::deployment("Failed to re-push scrcpy server: " + repushed.error().message);
    }

    auto bound = video::DecoderBinding::bind(*config.decoder, surface());
    if (bound.is_err()) {
        return bound.error();
    }
    res.binding = std::shared_ptr<video::DecoderBinding>(std::move(bound).value());

    std::unique_ptr<ScrcpyClient> client = backend_.create_client(makeClientOptions(config, choice.effective));
    if (!client) {
        return SessionError::protocol("Failed to create scrcpy client");
    }
    res.client = std::make_shared<ClientHandle>(std::move(client));
    res.client->client().setEventSink([this, generation](ClientEvent event) {
        enqueue(generation, std::move(event));
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) {
            return SessionError::cancelled("Session start cancelled");
        }
        pending_client_ = res.client;
    }

    auto started = res.client->client().start();
    if (started.is_err()) {
        return SessionError::protocol("Failed to start scrcpy client: " + started.error().message);
    }
    return {};
}

Result<void, SessionError> SessionController::advance(SessionState next) {
    SessionState old_state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) {
            return SessionError::cancelled("Session start cancelled");
        }
        old_state = state_;
        state_ = next;
    }
    publishState(old_state, next);
    return {};
}

void SessionController::unwindStart(StartResources& res) {
    if (res.client) {
        auto closed = res.client->close();
        if (closed.is_err()) {
            MLOG_WARN(TAG, "Closing client during unwind failed: %s", closed.error().message.c_str());
        }
    }
    if (res.binding) {
        res.binding->dispose();
    }
    res.client.reset();
    res.binding.reset();

    SessionState old_state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old_state = state_;
        state_ = SessionState::Idle;
        generation_++;
        pending_client_.reset();
        stream_size_.reset();
        stop_requested_ = false;
    }
    clearQueue();
    resetProgress();
    state_cv_.notify_all();
    if (old_state != SessionState::Idle) {
        publishState(old_state, SessionState::Idle);
    }
}

SessionController::EncoderChoice SessionController::chooseEncoder(
        const std::vector<std::string>& available, const std::string& preferred) {
    EncoderChoice choice;
    if (available.empty()) return choice;

    if (!preferred.empty() &&
        std::find(available.begin(), available.end(), preferred) != available.end()) {
        choice.effective = preferred;
        return choice;
    }
    choice.effective = available.front();
    choice.substituted = !preferred.empty();
    return choice;
}

// =============================================================================
// Stop
// =============================================================================

Result<void, SessionError> SessionController::stop() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (state_ == SessionState::Idle || state_ == SessionState::Stopping) {
        return {};
    }

    if (isStarting(state_)) {
        stop_requested_ = true;
        auto pending = pending_client_;
        bool on_start_thread = start_thread_ == std::this_thread::get_id();
        lock.unlock();

        MLOG_INFO(TAG, "Stop requested while starting");
        if (pending) {
            // Abort the handshake; start() sees the failure and unwinds
            auto closed = pending->close();
            if (closed.is_err()) {
                MLOG_WARN(TAG, "Aborting client failed: %s", closed.error().message.c_str());
            }
        }
        if (on_start_thread) {
            return {};
        }

        lock.lock();
        state_cv_.wait(lock, [this] { return !isStarting(state_); });
        return {};
    }

    teardownRunning(lock);
    return {};
}

// Called with `lock` held and state_ == Running; returns with it released
void SessionController::teardownRunning(std::unique_lock<std::mutex>& lock) {
    state_ = SessionState::Stopping;
    generation_++;
    auto client = std::move(client_);
    auto binding = std::move(binding_);
    client_.reset();
    binding_.reset();
    stream_size_.reset();
    lock.unlock();

    clearQueue();
    publishState(SessionState::Running, SessionState::Stopping);
    MLOG_INFO(TAG, "Stopping session on %s", device_serial_.c_str());

    if (client) {
        auto closed = client->close();
        if (closed.is_err()) {
            MLOG_WARN(TAG, "Client close failed: %s", closed.error().message.c_str());
        }
    }
    if (binding) {
        binding->dispose();
    }

    lock.lock();
    state_ = SessionState::Idle;
    lock.unlock();
    state_cv_.notify_all();
    publishState(SessionState::Stopping, SessionState::Idle);
    MLOG_INFO(TAG, "Session stopped");
}

bool SessionController::teardownIfCurrent(uint64_t generation) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ != SessionState::Running || generation != generation_) return false;
    teardownRunning(lock);
    return true;
}

// =============================================================================
// Client events
// =============================================================================

void SessionController::enqueue(uint64_t generation, ClientEvent event) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(QueuedEvent{generation, std::move(event)});
}

void SessionController::clearQueue() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.clear();
}

size_t SessionController::pollEvents() {
    std::deque<QueuedEvent> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        batch.swap(queue_);
    }

    size_t handled = 0;
    std::deque<QueuedEvent> deferred;
    for (auto& queued : batch) {
        SessionState state;
        uint64_t generation;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state = state_;
            generation = generation_;
        }

        // Late event from a session that is gone or being torn down
        if (queued.generation != generation) continue;

        if (!deferred.empty() || !dispatch(queued.event, state, queued.generation)) {
            deferred.push_back(std::move(queued));
            continue;
        }
        handled++;
    }

    if (!deferred.empty()) {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.insert(queue_.begin(),
                      std::make_move_iterator(deferred.begin()),
                      std::make_move_iterator(deferred.end()));
    }
    return handled;
}

bool SessionController::dispatch(ClientEvent& event, SessionState state, uint64_t generation) {
    const bool running = state == SessionState::Running;

    if (auto* e = std::get_if<client_event::Debug>(&event)) {
        MLOG_DEBUG("server", "%s", e->message.c_str());
        ServerLogEvent ev;
        ev.level = ServerLogEvent::Level::Debug;
        ev.message = e->message;
        events_.publish(ev);
        return true;
    }
    if (auto* e = std::get_if<client_event::Info>(&event)) {
        MLOG_INFO("server", "%s", e->message.c_str());
        ServerLogEvent ev;
        ev.level = ServerLogEvent::Level::Info;
        ev.message = e->message;
        events_.publish(ev);
        return true;
    }
    if (auto* e = std::get_if<client_event::ErrorMessage>(&event)) {
        MLOG_ERROR("server", "%s", e->message.c_str());
        publishError(SessionError::protocol(e->message));
        if (running) {
            teardownIfCurrent(generation);
        }
        return true;
    }

    // Everything below only applies to a running session
    if (!running) return false;

    if (std::holds_alternative<client_event::Close>(event)) {
        std::string serial = device_serial_;
        if (!teardownIfCurrent(generation)) return true;
        MLOG_WARN(TAG, "Client closed unexpectedly (%s)", serial.c_str());
        SessionClosedEvent ev;
        ev.device_serial = serial;
        events_.publish(ev);
        return true;
    }

    if (auto* e = std::get_if<client_event::SizeChanged>(&event)) {
        const auto& geometry = e->geometry;
        std::shared_ptr<video::DecoderBinding> binding;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // stop() may have begun since pollEvents() looked at the state
            if (state_ != SessionState::Running || generation != generation_) return true;
            stream_size_ = input::StreamSize{geometry.cropped_width, geometry.cropped_height};
            binding = binding_;
        }
        MLOG_INFO(TAG, "Stream size %dx%d", geometry.cropped_width, geometry.cropped_height);

        if (binding) {
            auto configured = binding->reconfigure(geometry);
            if (configured.is_err()) {
                if (binding->disposed()) return true;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (state_ != SessionState::Running || generation != generation_) return true;
                }
                publishError(SessionError::decoderUnavailable(
                    "Decoder rejected stream configuration: " + configured.error().message));
                teardownIfCurrent(generation);
                return true;
            }
        }

        // Observers see the new size only once the decoder accepted it
        StreamSizeChangedEvent ev;
        ev.width = geometry.cropped_width;
        ev.height = geometry.cropped_height;
        events_.publish(ev);
        return true;
    }

    if (auto* e = std::get_if<client_event::VideoData>(&event)) {
        std::shared_ptr<video::DecoderBinding> binding;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SessionState::Running || generation != generation_) return true;
            binding = binding_;
        }
        if (binding) {
            auto decoded = binding->decode(e->data);
            if (decoded.is_err()) {
                MLOG_DEBUG("decoder", "Frame dropped: %s", decoded.error().message.c_str());
            }
        }
        return true;
    }

    if (auto* e = std::get_if<client_event::ClipboardChange>(&event)) {
        ClipboardChangedEvent ev;
        ev.content = e->content;
        events_.publish(ev);
        return true;
    }

    return true;
}

// =============================================================================
// Input
// =============================================================================

std::optional<input::PointerCapture> SessionController::handlePointer(
        const input::PointerEvent& event, const input::SurfaceBounds& bounds) {
    std::shared_ptr<ClientHandle> client;
    input::StreamSize size;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Running || !client_ || !stream_size_) return std::nullopt;
        client = client_;
        size = *stream_size_;
    }

    auto mapping = input::mapPointerEvent(event, bounds, size);
    if (!mapping) return std::nullopt;

    client->injectTouch(mapping->touch);
    return mapping->capture;
}

bool SessionController::handleKey(const std::string& key) {
    std::shared_ptr<ClientHandle> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Running || !client_) return false;
        client = client_;
    }

    auto mapping = input::mapKey(key);
    if (!mapping) return false;

    if (auto* text = std::get_if<scrcpy::TextCommand>(&*mapping)) {
        client->injectText(text->text);
    } else {
        client->injectKeyCode(std::get<scrcpy::KeyCodeCommand>(*mapping));
    }
    return true;
}

bool SessionController::pressNavButton(input::NavButton button) {
    std::shared_ptr<ClientHandle> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Running || !client_) return false;
        client = client_;
    }

    if (button == input::NavButton::Back) {
        client->pressBackOrTurnOnScreen();
        return true;
    }
    auto cmd = input::navButtonKeyCode(button);
    if (!cmd) return false;
    client->injectKeyCode(*cmd);
    return true;
}

// =============================================================================
// Surface / state accessors
// =============================================================================

Result<std::shared_ptr<video::RenderSurface>, SessionError> SessionController::prepareSurface(
        const video::DecoderDescriptor& decoder) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Idle) {
        return SessionError::invalidState("Decoder can only be changed while stopped");
    }
    return slot_.ensure(decoder);
}

std::shared_ptr<video::RenderSurface> SessionController::surface() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot_.surface();
}

SessionState SessionController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<input::StreamSize> SessionController::streamSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_size_;
}

std::vector<std::string> SessionController::availableEncoders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return encoders_;
}

std::string SessionController::effectiveEncoder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return effective_encoder_;
}

// =============================================================================
// Progress
// =============================================================================

TransferProgress SessionController::downloadProgress() const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return download_.progress();
}

TransferProgress SessionController::uploadProgress() const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return upload_.progress();
}

DeploymentProgress SessionController::deploymentProgress() const {
    DeploymentProgress p;
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        p.download = download_.progress();
        p.upload = upload_.progress();
    }
    p.push_step_visible = p.download.complete();
    p.start_step_visible = p.upload.complete();
    p.download_text = formatSpeed(p.download.debounced_transferred, p.download.total, p.download.speed);
    p.upload_text = formatSpeed(p.upload.debounced_transferred, p.upload.total, p.upload.speed);
    return p;
}

void SessionController::resetProgress() {
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        download_.reset();
        upload_.reset();
    }
}

// =============================================================================
// Observers
// =============================================================================

void SessionController::publishState(SessionState old_state, SessionState new_state) {
    MLOG_DEBUG(TAG, "State: %s -> %s", sessionStateToString(old_state), sessionStateToString(new_state));
    SessionStateChangedEvent ev;
    ev.old_state = old_state;
    ev.new_state = new_state;
    events_.publish(ev);
}

void SessionController::publishError(const SessionError& error) {
    SessionErrorEvent ev;
    ev.kind = error.kind;
    ev.message = error.message;
    events_.publish(ev);
}

void SessionController::publishProgress(TransferProgressEvent::Phase phase) {
    TransferProgressEvent ev;
    ev.phase = phase;
    ev.progress = phase == TransferProgressEvent::Phase::Download ? downloadProgress() : uploadProgress();
    events_.publish(ev);
}

} // namespace mirador
