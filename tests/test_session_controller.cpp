// =============================================================================
// Mirador - SessionController Unit Tests
// =============================================================================
// The scrcpy client, ADB device and decoder are replaced by fakes that record
// every call into one shared trace, so ordering across them can be checked.
// =============================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "session/session_controller.hpp"

using namespace mirador;
using namespace std::chrono_literals;

namespace {

// =============================================================================
// Fakes
// =============================================================================

// Options are kept without their device: the fake device holds the env,
// so storing the pointer here would keep both alive forever.
ClientOptions detached(const ClientOptions& options) {
    ClientOptions copy = options;
    copy.device.reset();
    return copy;
}

struct FakeEnv {
    std::mutex m;
    std::condition_variable cv;
    std::vector<std::string> trace;

    // Failure switches
    bool fail_fetch = false;
    bool fail_sync = false;
    bool fail_push = false;
    bool fail_probe = false;
    bool fail_start = false;
    bool fail_configure = false;
    bool null_client = false;
    bool block_start = false;      // client start() waits until closed

    std::vector<std::string> encoders{"c2.android.avc.encoder", "OMX.google.h264.encoder"};
    std::vector<ClientEvent> events_on_start;

    std::vector<ClientOptions> probe_options;
    std::vector<ClientOptions> client_options;
    std::vector<std::string> client_serials;
    ClientEventSink sink;
    bool start_entered = false;
    bool client_closed = false;

    std::vector<scrcpy::TouchCommand> touches;
    std::vector<scrcpy::KeyCodeCommand> key_codes;
    std::vector<std::string> texts;
    int back_presses = 0;
    int client_closes = 0;
    int decoder_disposes = 0;

    void record(const std::string& entry) {
        std::lock_guard<std::mutex> lock(m);
        trace.push_back(entry);
    }

    std::vector<std::string> traceCopy() {
        std::lock_guard<std::mutex> lock(m);
        return trace;
    }

    size_t count(const std::string& entry) {
        std::lock_guard<std::mutex> lock(m);
        return static_cast<size_t>(std::count(trace.begin(), trace.end(), entry));
    }

    // Deliver an event the way the client's reader thread would
    void emit(ClientEvent event) {
        ClientEventSink s;
        {
            std::lock_guard<std::mutex> lock(m);
            s = sink;
        }
        if (s) s(std::move(event));
    }
};

class FakeSync : public AdbSync {
public:
    explicit FakeSync(std::shared_ptr<FakeEnv> env) : env_(std::move(env)) {}

    Result<void, Error> write(const std::string& path,
                              const std::vector<uint8_t>& buffer,
                              const SyncProgressCallback& on_progress) override {
        env_->record("push " + path);
        if (env_->fail_push) return Error("device storage full");
        if (on_progress) {
            on_progress(buffer.size() / 2);
            on_progress(buffer.size());
        }
        return {};
    }

private:
    std::shared_ptr<FakeEnv> env_;
};

class FakeDevice : public AdbDevice {
public:
    explicit FakeDevice(std::shared_ptr<FakeEnv> env) : env_(std::move(env)) {}

    std::string serial() const override { return "emulator-5554"; }

    Result<std::unique_ptr<AdbSync>, Error> sync() override {
        if (env_->fail_sync) return Error("device offline");
        return std::unique_ptr<AdbSync>(std::make_unique<FakeSync>(env_));
    }

private:
    std::shared_ptr<FakeEnv> env_;
};

class FakeClient : public ScrcpyClient {
public:
    explicit FakeClient(std::shared_ptr<FakeEnv> env) : env_(std::move(env)) {}

    void setEventSink(ClientEventSink sink) override {
        std::lock_guard<std::mutex> lock(env_->m);
        env_->sink = std::move(sink);
    }

    Result<void, Error> start() override {
        env_->record("start");
        if (env_->block_start) {
            std::unique_lock<std::mutex> lock(env_->m);
            env_->start_entered = true;
            env_->cv.notify_all();
            env_->cv.wait(lock, [this] { return env_->client_closed; });
            return Error("connection aborted");
        }
        if (env_->fail_start) return Error("server exited with code 1");
        for (auto& event : env_->events_on_start) {
            env_->emit(event);
        }
        return {};
    }

    Result<void, Error> close() override {
        env_->record("close");
        {
            std::lock_guard<std::mutex> lock(env_->m);
            env_->client_closes++;
            env_->client_closed = true;
        }
        env_->cv.notify_all();
        return {};
    }

    void injectTouch(const scrcpy::TouchCommand& cmd) override {
        std::lock_guard<std::mutex> lock(env_->m);
        env_->touches.push_back(cmd);
    }
    void injectKeyCode(const scrcpy::KeyCodeCommand& cmd) override {
        std::lock_guard<std::mutex> lock(env_->m);
        env_->key_codes.push_back(cmd);
    }
    void injectText(const std::string& text) override {
        std::lock_guard<std::mutex> lock(env_->m);
        env_->texts.push_back(text);
    }
    void pressBackOrTurnOnScreen() override {
        std::lock_guard<std::mutex> lock(env_->m);
        env_->back_presses++;
    }

private:
    std::shared_ptr<FakeEnv> env_;
};

class FakeDecoder : public video::Decoder {
public:
    explicit FakeDecoder(std::shared_ptr<FakeEnv> env) : env_(std::move(env)) {}

    Result<void, Error> configure(const scrcpy::VideoGeometry& g) override {
        env_->record("configure " + std::to_string(g.cropped_width) + "x" +
                     std::to_string(g.cropped_height));
        if (env_->fail_configure) return Error("profile not supported");
        return {};
    }

    Result<void, Error> decode(const std::vector<uint8_t>& data) override {
        env_->record("decode " + std::to_string(data.size()));
        return {};
    }

    void dispose() override {
        env_->record("dispose");
        std::lock_guard<std::mutex> lock(env_->m);
        env_->decoder_disposes++;
    }

private:
    std::shared_ptr<FakeEnv> env_;
};

ScrcpyBackend makeBackend(std::shared_ptr<FakeEnv> env) {
    ScrcpyBackend backend;
    backend.get_encoders = [env](const ClientOptions& options)
            -> Result<std::vector<std::string>, Error> {
        env->record("probe");
        {
            std::lock_guard<std::mutex> lock(env->m);
            env->probe_options.push_back(detached(options));
        }
        if (env->fail_probe) return Error("server exited before listing encoders");
        return env->encoders;
    };
    backend.create_client = [env](const ClientOptions& options) -> std::unique_ptr<ScrcpyClient> {
        env->record("create");
        {
            std::lock_guard<std::mutex> lock(env->m);
            env->client_options.push_back(detached(options));
            env->client_serials.push_back(options.device ? options.device->serial() : "");
        }
        if (env->null_client) return nullptr;
        return std::make_unique<FakeClient>(env);
    };
    return backend;
}

ServerFetcher makeFetcher(std::shared_ptr<FakeEnv> env) {
    return [env](const FetchProgressCallback& on_progress) -> Result<std::vector<uint8_t>, Error> {
        env->record("fetch");
        if (env->fail_fetch) return Error("HTTP 404");
        std::vector<uint8_t> jar(1000, 0x42);
        if (on_progress) {
            on_progress(0, jar.size());
            on_progress(jar.size(), jar.size());
        }
        return jar;
    };
}

video::DecoderDescriptor fakeDecoder(std::shared_ptr<FakeEnv> env,
                                     const std::string& name = "software",
                                     const std::string& context = "2d") {
    video::DecoderDescriptor d;
    d.name = name;
    d.context_type = context;
    d.factory = [env](video::RenderSurface&) -> std::unique_ptr<video::Decoder> {
        return std::make_unique<FakeDecoder>(env);
    };
    return d;
}

scrcpy::VideoGeometry geometry(int w, int h) {
    scrcpy::VideoGeometry g;
    g.width = w;
    g.height = h;
    g.cropped_width = w;
    g.cropped_height = h;
    return g;
}

} // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class SessionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        env = std::make_shared<FakeEnv>();
        device = std::make_shared<FakeDevice>(env);

        subs.push_back(events.subscribe<SessionStateChangedEvent>(
            [this](const SessionStateChangedEvent& e) {
                std::lock_guard<std::mutex> lock(rec_mutex);
                states.push_back(e.new_state);
            }));
        subs.push_back(events.subscribe<SessionErrorEvent>(
            [this](const SessionErrorEvent& e) {
                std::lock_guard<std::mutex> lock(rec_mutex);
                errors.push_back(e.kind);
            }));
        subs.push_back(events.subscribe<SessionClosedEvent>(
            [this](const SessionClosedEvent& e) {
                std::lock_guard<std::mutex> lock(rec_mutex);
                closed_serials.push_back(e.device_serial);
            }));
        subs.push_back(events.subscribe<EncoderSelectedEvent>(
            [this](const EncoderSelectedEvent& e) {
                std::lock_guard<std::mutex> lock(rec_mutex);
                encoder_events.push_back(e);
            }));
        subs.push_back(events.subscribe<ServerLogEvent>(
            [this](const ServerLogEvent& e) {
                std::lock_guard<std::mutex> lock(rec_mutex);
                server_logs.push_back(e.message);
            }));
        subs.push_back(events.subscribe<ClipboardChangedEvent>(
            [this](const ClipboardChangedEvent& e) {
                std::lock_guard<std::mutex> lock(rec_mutex);
                clipboard.push_back(e.content);
            }));
        subs.push_back(events.subscribe<StreamSizeChangedEvent>(
            [this](const StreamSizeChangedEvent& e) {
                std::lock_guard<std::mutex> lock(rec_mutex);
                sizes.push_back({e.width, e.height});
            }));

        controller = std::make_unique<SessionController>(makeBackend(env), makeFetcher(env), events);
    }

    SessionConfig config() {
        SessionConfig c;
        c.device = device;
        c.decoder = fakeDecoder(env);
        return c;
    }

    void startRunning() {
        auto result = controller->start(config());
        ASSERT_TRUE(result.is_ok()) << result.error().message;
        ASSERT_EQ(controller->state(), SessionState::Running);
    }

    void startWithStream(int w, int h) {
        startRunning();
        env->emit(client_event::SizeChanged{geometry(w, h)});
        ASSERT_EQ(controller->pollEvents(), 1u);
    }

    input::SurfaceBounds bounds540x960() {
        input::SurfaceBounds b;
        b.width = 540.0f;
        b.height = 960.0f;
        return b;
    }

    input::PointerEvent primary(input::PointerEventType type, float x, float y) {
        input::PointerEvent e;
        e.type = type;
        e.pointer_id = 1;
        e.client_x = x;
        e.client_y = y;
        e.button = type == input::PointerEventType::Move ? -1 : 0;
        e.buttons = type == input::PointerEventType::Up ? 0 : 1;
        e.pressure = 1.0f;
        return e;
    }

    std::shared_ptr<FakeEnv> env;
    std::shared_ptr<FakeDevice> device;

    EventBus events;
    std::vector<SubscriptionHandle> subs;

    std::mutex rec_mutex;
    std::vector<SessionState> states;
    std::vector<SessionError::Kind> errors;
    std::vector<std::string> closed_serials;
    std::vector<EncoderSelectedEvent> encoder_events;
    std::vector<std::string> server_logs;
    std::vector<std::string> clipboard;
    std::vector<input::StreamSize> sizes;

    std::unique_ptr<SessionController> controller;
};

// =============================================================================
// Start sequence
// =============================================================================

TEST_F(SessionControllerTest, StartReachesRunning) {
    startRunning();

    EXPECT_EQ(states, (std::vector<SessionState>{
        SessionState::FetchingServer, SessionState::DeployingServer,
        SessionState::NegotiatingEncoder, SessionState::Starting, SessionState::Running}));
    EXPECT_TRUE(errors.empty());
    EXPECT_TRUE(controller->running());
}

TEST_F(SessionControllerTest, ServerPushedAgainAfterProbe) {
    startRunning();

    const std::string push = std::string("push ") + DEFAULT_SERVER_PATH;
    EXPECT_EQ(env->traceCopy(), (std::vector<std::string>{
        "fetch", push, "probe", push, "create", "start"}));
}

TEST_F(SessionControllerTest, ClientOptionsFollowConfig) {
    auto cfg = config();
    cfg.max_size = 720;
    cfg.bit_rate = 2000000;
    cfg.tunnel_forward = true;
    ASSERT_TRUE(controller->start(cfg).is_ok());

    ASSERT_EQ(env->probe_options.size(), 1u);
    EXPECT_TRUE(env->probe_options[0].encoder.empty());
    EXPECT_TRUE(env->probe_options[0].tunnel_forward);

    ASSERT_EQ(env->client_options.size(), 1u);
    const auto& options = env->client_options[0];
    EXPECT_EQ(options.encoder, "c2.android.avc.encoder");
    EXPECT_EQ(options.max_size, 720);
    EXPECT_EQ(options.bit_rate, 2000000);
    EXPECT_TRUE(options.tunnel_forward);
    EXPECT_EQ(options.server_version, "1.19");
    EXPECT_EQ(options.profile, scrcpy::AndroidCodecProfile::Baseline);
    EXPECT_EQ(options.level, scrcpy::AndroidCodecLevel::Level4);
    EXPECT_EQ(options.orientation, scrcpy::ScrcpyScreenOrientation::Unlocked);
    EXPECT_EQ(env->client_serials, (std::vector<std::string>{"emulator-5554"}));
}

TEST_F(SessionControllerTest, FakesReleasedWithController) {
    std::weak_ptr<FakeEnv> weak_env = env;
    startRunning();
    controller.reset();

    subs.clear();
    device.reset();
    env.reset();
    EXPECT_TRUE(weak_env.expired());
}

TEST_F(SessionControllerTest, StartAsyncCompletes) {
    auto future = controller->startAsync(config());
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(future.get().is_ok());
    EXPECT_TRUE(controller->running());
}

TEST_F(SessionControllerTest, StartWhileRunningRejected) {
    startRunning();

    auto result = controller->start(config());
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, SessionError::Kind::InvalidState);
    EXPECT_TRUE(controller->running());
    EXPECT_EQ(env->count("create"), 1u);
}

// =============================================================================
// Encoder negotiation
// =============================================================================

TEST_F(SessionControllerTest, EmptyEncoderListFails) {
    env->encoders.clear();

    auto result = controller->start(config());
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, SessionError::Kind::Negotiation);
    EXPECT_EQ(result.error().message, "No available encoder found");

    EXPECT_EQ(controller->state(), SessionState::Idle);
    EXPECT_EQ(env->count("create"), 0u);
    EXPECT_EQ(errors, (std::vector<SessionError::Kind>{SessionError::Kind::Negotiation}));
    EXPECT_EQ(states.back(), SessionState::Idle);
}

TEST_F(SessionControllerTest, ProbeFailureIsNegotiationError) {
    env->fail_probe = true;

    auto result = controller->start(config());
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, SessionError::Kind::Negotiation);
    EXPECT_EQ(controller->state(), SessionState::Idle);
}

TEST_F(SessionControllerTest, PreferredEncoderHonoured) {
    auto cfg = config();
    cfg.encoder = "OMX.google.h264.encoder";
    ASSERT_TRUE(controller->start(cfg).is_ok());

    EXPECT_EQ(controller->effectiveEncoder(), "OMX.google.h264.encoder");
    ASSERT_EQ(encoder_events.size(), 1u);
    EXPECT_FALSE(encoder_events[0].substituted);
    EXPECT_EQ(env->client_options[0].encoder, "OMX.google.h264.encoder");
}

TEST_F(SessionControllerTest, UnavailableEncoderSubstituted) {
    auto cfg = config();
    cfg.encoder = "c2.qti.avc.encoder";
    ASSERT_TRUE(controller->start(cfg).is_ok());

    EXPECT_EQ(controller->effectiveEncoder(), "c2.android.avc.encoder");
    EXPECT_EQ(controller->availableEncoders(), env->encoders);
    ASSERT_EQ(encoder_events.size(), 1u);
    EXPECT_TRUE(encoder_events[0].substituted);
    EXPECT_EQ(encoder_events[0].requested, "c2.qti.avc.encoder");
    EXPECT_EQ(encoder_events[0].effective, "c2.android.avc.encoder");
}

TEST(ChooseEncoderTest, Rules) {
    std::vector<std::string> available{"a", "b"};

    auto none = SessionController::chooseEncoder(available, "");
    EXPECT_EQ(none.effective, "a");
    EXPECT_FALSE(none.substituted);

    auto listed = SessionController::chooseEncoder(available, "b");
    EXPECT_EQ(listed.effective, "b");
    EXPECT_FALSE(listed.substituted);

    auto missing = SessionController::chooseEncoder(available, "c");
    EXPECT_EQ(missing.effective, "a");
    EXPECT_TRUE(missing.substituted);
}

// =============================================================================
// Start failures
// =============================================================================

TEST_F(SessionControllerTest, NoDecoderFails) {
    auto cfg = config();
    cfg.decoder.reset();

    auto result = controller->start(cfg);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, SessionError::Kind::DecoderUnavailable);
    EXPECT_EQ(controller->state(), SessionState::Idle);
    EXPECT_TRUE(env->traceCopy().empty());
    EXPECT_TRUE(states.empty());
}

TEST_F(SessionControllerTest, NoDeviceFails) {
    auto cfg = config();
    cfg.device.reset();

    auto result = controller->start(cfg);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, SessionError::Kind::Deployment);
    EXPECT_TRUE(env->traceCopy().empty());
}

TEST_F(SessionControllerTest, FetchFailureIsDeploymentError) {
    env->fail_fetch = true;

    auto result = controller->start(config());
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, SessionError::Kind::Deployment);
    EXPECT_EQ(env->traceCopy(), (std::vector<std::string>{"fetch"}));
    EXPECT_EQ(controller->state(), SessionState::Idle);
    EXPECT_FALSE(controller->deploymentProgress().push_step_visible);
}

TEST_F(SessionControllerTest, PushFailureIsDeploymentError) {
    env->fail_push = true;

    auto result = controller->start(config());
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, SessionError::Kind::Deployment);
    EXPECT_EQ(env->count("probe"), 0u);
    EXPECT_EQ(controller->state(), SessionState::Idle);
}

TEST_F(SessionControllerTest, SyncFailureIsDeploymentError) {
    env->fail_sync = true;

    auto result = controller->start(config());
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, SessionError::Kind::Deployment);
}

TEST_F(SessionControllerTest, ClientStartFailureReleasesEverything) {
    env->fail_start = true;

    auto result = controller->start(config());
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, SessionError::Kind::Protocol);
    EXPECT_EQ(controller->state(), SessionState::Idle);
    EXPECT_EQ(env->client_closes, 1);
    EXPECT_EQ(env->decoder_disposes, 1);
    EXPECT_EQ(errors, (std::vector<SessionError::Kind>{SessionError::Kind::Protocol}));
}

TEST_F(SessionControllerTest, NullClientIsProtocolError) {
    env->null_client = true;

    auto result = controller->start(config());
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, SessionError::Kind::Protocol);
    EXPECT_EQ(env->decoder_disposes, 1);
}

TEST_F(SessionControllerTest, CanRestartAfterFailure) {
    env->encoders.clear();
    ASSERT_TRUE(controller->start(config()).is_err());

    env->encoders = {"c2.android.avc.encoder"};
    startRunning();
}

// =============================================================================
// Stop
// =============================================================================

TEST_F(SessionControllerTest, StopFromIdleIsNoop) {
    EXPECT_TRUE(controller->stop().is_ok());
    EXPECT_TRUE(states.empty());
}

TEST_F(SessionControllerTest, DoubleStopReleasesOnce) {
    startRunning();

    EXPECT_TRUE(controller->stop().is_ok());
    EXPECT_TRUE(controller->stop().is_ok());

    EXPECT_EQ(controller->state(), SessionState::Idle);
    EXPECT_EQ(env->client_closes, 1);
    EXPECT_EQ(env->decoder_disposes, 1);
    EXPECT_EQ(states.back(), SessionState::Idle);
    EXPECT_FALSE(controller->streamSize().has_value());
}

TEST_F(SessionControllerTest, DestructorStopsSession) {
    startRunning();
    controller.reset();

    EXPECT_EQ(env->client_closes, 1);
    EXPECT_EQ(env->decoder_disposes, 1);
}

TEST_F(SessionControllerTest, StopDuringStartCancels) {
    env->block_start = true;

    auto future = controller->startAsync(config());
    {
        std::unique_lock<std::mutex> lock(env->m);
        ASSERT_TRUE(env->cv.wait_for(lock, 5s, [this] { return env->start_entered; }));
    }

    EXPECT_TRUE(controller->stop().is_ok());
    EXPECT_EQ(controller->state(), SessionState::Idle);

    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    auto result = future.get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, SessionError::Kind::Cancelled);

    EXPECT_EQ(env->client_closes, 1);
    EXPECT_EQ(env->decoder_disposes, 1);
    std::lock_guard<std::mutex> lock(rec_mutex);
    EXPECT_TRUE(errors.empty());
}

TEST_F(SessionControllerTest, StopFromObserverDuringStartCancels) {
    auto sub = events.subscribe<SessionStateChangedEvent>(
        [this](const SessionStateChangedEvent& e) {
            if (e.new_state == SessionState::NegotiatingEncoder) {
                EXPECT_TRUE(controller->stop().is_ok());
            }
        });

    auto result = controller->start(config());
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, SessionError::Kind::Cancelled);
    EXPECT_EQ(controller->state(), SessionState::Idle);
    EXPECT_EQ(env->count("create"), 0u);
    EXPECT_TRUE(errors.empty());
}

// =============================================================================
// Client events
// =============================================================================

TEST_F(SessionControllerTest, SizeChangeConfiguresDecoderBeforeFrames) {
    startRunning();

    env->emit(client_event::SizeChanged{geometry(1080, 1920)});
    env->emit(client_event::VideoData{std::vector<uint8_t>(32)});
    EXPECT_EQ(controller->pollEvents(), 2u);

    auto trace = env->traceCopy();
    auto configure = std::find(trace.begin(), trace.end(), "configure 1080x1920");
    auto decode = std::find(trace.begin(), trace.end(), "decode 32");
    ASSERT_NE(configure, trace.end());
    ASSERT_NE(decode, trace.end());
    EXPECT_LT(configure, decode);

    ASSERT_TRUE(controller->streamSize().has_value());
    EXPECT_EQ(*controller->streamSize(), (input::StreamSize{1080, 1920}));
    EXPECT_EQ(sizes, (std::vector<input::StreamSize>{{1080, 1920}}));
    EXPECT_EQ(controller->surface()->width(), 1080);
}

TEST_F(SessionControllerTest, EventsDuringStartAppliedOnceRunning) {
    env->events_on_start = {client_event::Info{"Device: Pixel 5"},
                            client_event::SizeChanged{geometry(720, 1280)}};
    startRunning();

    EXPECT_FALSE(controller->streamSize().has_value());
    EXPECT_EQ(controller->pollEvents(), 2u);
    ASSERT_TRUE(controller->streamSize().has_value());
    EXPECT_EQ(*controller->streamSize(), (input::StreamSize{720, 1280}));
    EXPECT_EQ(server_logs, (std::vector<std::string>{"Device: Pixel 5"}));
}

TEST_F(SessionControllerTest, LateEventsAfterStopDiscarded) {
    startRunning();
    controller->stop();

    env->emit(client_event::SizeChanged{geometry(1080, 1920)});
    env->emit(client_event::VideoData{std::vector<uint8_t>(8)});
    env->emit(client_event::Close{});

    EXPECT_EQ(controller->pollEvents(), 0u);
    EXPECT_EQ(env->count("configure 1080x1920"), 0u);
    EXPECT_EQ(env->count("decode 8"), 0u);
    EXPECT_TRUE(closed_serials.empty());
    EXPECT_EQ(controller->state(), SessionState::Idle);
}

TEST_F(SessionControllerTest, OldSessionEventsDoNotReachNewSession) {
    startRunning();
    ClientEventSink old_sink;
    {
        std::lock_guard<std::mutex> lock(env->m);
        old_sink = env->sink;
    }
    controller->stop();
    startRunning();

    old_sink(client_event::SizeChanged{geometry(640, 480)});
    EXPECT_EQ(controller->pollEvents(), 0u);
    EXPECT_FALSE(controller->streamSize().has_value());
}

TEST_F(SessionControllerTest, StopFromSizeObserverLeavesSessionIdle) {
    startRunning();
    auto sub = events.subscribe<StreamSizeChangedEvent>(
        [this](const StreamSizeChangedEvent&) {
            EXPECT_TRUE(controller->stop().is_ok());
        });

    env->emit(client_event::SizeChanged{geometry(1080, 1920)});
    controller->pollEvents();

    EXPECT_EQ(controller->state(), SessionState::Idle);
    EXPECT_FALSE(controller->streamSize().has_value());
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(env->client_closes, 1);
    EXPECT_EQ(env->decoder_disposes, 1);
}

TEST_F(SessionControllerTest, RestartFromSizeObserverKeepsNewSession) {
    startRunning();
    bool restarted = false;
    auto sub = events.subscribe<StreamSizeChangedEvent>(
        [this, &restarted](const StreamSizeChangedEvent&) {
            if (restarted) return;
            restarted = true;
            EXPECT_TRUE(controller->stop().is_ok());
            EXPECT_TRUE(controller->start(config()).is_ok());
        });

    env->emit(client_event::SizeChanged{geometry(1080, 1920)});
    controller->pollEvents();

    EXPECT_TRUE(restarted);
    EXPECT_EQ(controller->state(), SessionState::Running);
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(env->count("create"), 2u);
    EXPECT_EQ(env->client_closes, 1);
    EXPECT_FALSE(controller->streamSize().has_value());
}

TEST_F(SessionControllerTest, UnsolicitedCloseTearsDown) {
    startRunning();

    env->emit(client_event::Close{});
    EXPECT_EQ(controller->pollEvents(), 1u);

    EXPECT_EQ(controller->state(), SessionState::Idle);
    EXPECT_EQ(env->client_closes, 1);
    EXPECT_EQ(env->decoder_disposes, 1);
    EXPECT_EQ(closed_serials, (std::vector<std::string>{"emulator-5554"}));
}

TEST_F(SessionControllerTest, ClientErrorWhileRunningTearsDown) {
    startRunning();

    env->emit(client_event::ErrorMessage{"video socket reset"});
    controller->pollEvents();

    EXPECT_EQ(controller->state(), SessionState::Idle);
    EXPECT_EQ(errors, (std::vector<SessionError::Kind>{SessionError::Kind::Protocol}));
    EXPECT_EQ(env->client_closes, 1);
}

TEST_F(SessionControllerTest, DecoderRejectingGeometryTearsDown) {
    startRunning();
    env->fail_configure = true;

    env->emit(client_event::SizeChanged{geometry(4096, 2160)});
    env->emit(client_event::VideoData{std::vector<uint8_t>(8)});
    controller->pollEvents();

    EXPECT_EQ(controller->state(), SessionState::Idle);
    EXPECT_EQ(errors, (std::vector<SessionError::Kind>{SessionError::Kind::DecoderUnavailable}));
    EXPECT_EQ(env->count("decode 8"), 0u);
    EXPECT_EQ(env->decoder_disposes, 1);
}

TEST_F(SessionControllerTest, ServerLogsAndClipboardForwarded) {
    startRunning();

    env->emit(client_event::Debug{"Using encoder: c2.android.avc.encoder"});
    env->emit(client_event::ClipboardChange{"hello from device"});
    EXPECT_EQ(controller->pollEvents(), 2u);

    EXPECT_EQ(server_logs, (std::vector<std::string>{"Using encoder: c2.android.avc.encoder"}));
    EXPECT_EQ(clipboard, (std::vector<std::string>{"hello from device"}));
}

// =============================================================================
// Input
// =============================================================================

TEST_F(SessionControllerTest, InputIgnoredWhenNotRunning) {
    EXPECT_FALSE(controller->handleKey("a"));
    EXPECT_FALSE(controller->pressNavButton(input::NavButton::Home));
    EXPECT_FALSE(controller->handlePointer(primary(input::PointerEventType::Down, 10, 10),
                                           bounds540x960()).has_value());
    EXPECT_TRUE(env->texts.empty());
    EXPECT_TRUE(env->key_codes.empty());
}

TEST_F(SessionControllerTest, PointerIgnoredUntilStreamSizeKnown) {
    startRunning();

    EXPECT_FALSE(controller->handlePointer(primary(input::PointerEventType::Down, 10, 10),
                                           bounds540x960()).has_value());
    EXPECT_TRUE(env->touches.empty());
}

TEST_F(SessionControllerTest, PointerMappedToDeviceCoordinates) {
    startWithStream(1080, 1920);

    auto down = controller->handlePointer(primary(input::PointerEventType::Down, 0, 0),
                                          bounds540x960());
    ASSERT_TRUE(down.has_value());
    EXPECT_EQ(*down, input::PointerCapture::Acquire);

    auto move = controller->handlePointer(primary(input::PointerEventType::Move, 270, 480),
                                          bounds540x960());
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(*move, input::PointerCapture::None);

    auto up = controller->handlePointer(primary(input::PointerEventType::Up, 600, 1000),
                                        bounds540x960());
    ASSERT_TRUE(up.has_value());
    EXPECT_EQ(*up, input::PointerCapture::Release);

    ASSERT_EQ(env->touches.size(), 3u);
    EXPECT_EQ(env->touches[0].action, scrcpy::AndroidMotionEventAction::Down);
    EXPECT_FLOAT_EQ(env->touches[1].pointer_x, 540.0f);
    EXPECT_FLOAT_EQ(env->touches[1].pointer_y, 960.0f);
    EXPECT_EQ(env->touches[1].pressure, scrcpy::PRESSURE_MAX);
    EXPECT_FLOAT_EQ(env->touches[2].pointer_x, 1080.0f);
    EXPECT_FLOAT_EQ(env->touches[2].pointer_y, 1920.0f);
}

TEST_F(SessionControllerTest, KeysRoutedToTextOrKeyCode) {
    startRunning();

    EXPECT_TRUE(controller->handleKey("a"));
    EXPECT_TRUE(controller->handleKey("Backspace"));
    EXPECT_FALSE(controller->handleKey("F5"));

    EXPECT_EQ(env->texts, (std::vector<std::string>{"a"}));
    ASSERT_EQ(env->key_codes.size(), 1u);
    EXPECT_EQ(env->key_codes[0].key_code, scrcpy::AndroidKeyCode::Delete);
}

TEST_F(SessionControllerTest, NavButtons) {
    startRunning();

    EXPECT_TRUE(controller->pressNavButton(input::NavButton::Back));
    EXPECT_TRUE(controller->pressNavButton(input::NavButton::Home));
    EXPECT_TRUE(controller->pressNavButton(input::NavButton::AppSwitch));

    EXPECT_EQ(env->back_presses, 1);
    ASSERT_EQ(env->key_codes.size(), 2u);
    EXPECT_EQ(env->key_codes[0].key_code, scrcpy::AndroidKeyCode::Home);
    EXPECT_EQ(env->key_codes[1].key_code, scrcpy::AndroidKeyCode::AppSwitch);
}

// =============================================================================
// Surface and progress
// =============================================================================

TEST_F(SessionControllerTest, SurfaceRebuiltOnlyWhenDecoderKindChanges) {
    auto first = controller->prepareSurface(fakeDecoder(env));
    ASSERT_TRUE(first.is_ok());
    auto same = controller->prepareSurface(fakeDecoder(env));
    ASSERT_TRUE(same.is_ok());
    EXPECT_EQ(first.value()->id(), same.value()->id());

    auto other = controller->prepareSurface(fakeDecoder(env, "hardware", "gpu"));
    ASSERT_TRUE(other.is_ok());
    EXPECT_NE(other.value()->id(), first.value()->id());
}

TEST_F(SessionControllerTest, SurfaceLockedWhileRunning) {
    startRunning();
    auto surface_id = controller->surface()->id();

    auto result = controller->prepareSurface(fakeDecoder(env, "hardware", "gpu"));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, SessionError::Kind::InvalidState);
    EXPECT_EQ(controller->surface()->id(), surface_id);
}

TEST_F(SessionControllerTest, DeploymentProgressAfterStart) {
    startRunning();

    auto progress = controller->deploymentProgress();
    EXPECT_TRUE(progress.push_step_visible);
    EXPECT_TRUE(progress.start_step_visible);
    EXPECT_EQ(progress.download.total, 1000u);
    EXPECT_EQ(progress.upload.transferred, 1000u);
    EXPECT_EQ(progress.download.debounced_transferred, 1000u);
    EXPECT_EQ(progress.download_text, "1000 B of 1000 B");
    EXPECT_EQ(progress.upload.debounced_transferred, 1000u);
    EXPECT_FALSE(progress.download.speed.has_value());
}
