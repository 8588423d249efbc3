// =============================================================================
// Mirador - scrcpy Client Contract
// =============================================================================
// The wire-protocol client, the ADB file-sync channel and the server download
// are implemented elsewhere; the session controller only talks to them
// through the types below.
// =============================================================================
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "result.hpp"
#include "scrcpy_protocol.hpp"

namespace mirador {

class AdbDevice;

// =============================================================================
// Client options (one per client instance)
// =============================================================================
struct ClientOptions {
    std::shared_ptr<AdbDevice> device;
    std::string server_path;
    std::string server_version;
    scrcpy::ScrcpyLogLevel log_level = scrcpy::ScrcpyLogLevel::Debug;
    int max_size = 1080;                  // longer side, 0 = unlimited
    int bit_rate = 4000000;
    std::string encoder;                  // empty = server default
    bool tunnel_forward = false;
    scrcpy::ScrcpyScreenOrientation orientation = scrcpy::ScrcpyScreenOrientation::Unlocked;
    scrcpy::AndroidCodecProfile profile = scrcpy::AndroidCodecProfile::Baseline;
    scrcpy::AndroidCodecLevel level = scrcpy::AndroidCodecLevel::Level4;
};

// =============================================================================
// Client events, delivered in arrival order
// =============================================================================
namespace client_event {

struct Debug { std::string message; };
struct Info { std::string message; };
struct ErrorMessage { std::string message; };
struct Close {};
struct SizeChanged { scrcpy::VideoGeometry geometry; };
struct VideoData { std::vector<uint8_t> data; };
struct ClipboardChange { std::string content; };

} // namespace client_event

using ClientEvent = std::variant<client_event::Debug,
                                 client_event::Info,
                                 client_event::ErrorMessage,
                                 client_event::Close,
                                 client_event::SizeChanged,
                                 client_event::VideoData,
                                 client_event::ClipboardChange>;

// May be invoked from any thread owned by the client
using ClientEventSink = std::function<void(ClientEvent event)>;

// =============================================================================
// ScrcpyClient - one running server process plus its control/video sockets
// =============================================================================
class ScrcpyClient {
public:
    virtual ~ScrcpyClient() = default;

    // Must be set before start()
    virtual void setEventSink(ClientEventSink sink) = 0;

    virtual Result<void, Error> start() = 0;
    virtual Result<void, Error> close() = 0;

    virtual void injectTouch(const scrcpy::TouchCommand& cmd) = 0;
    virtual void injectKeyCode(const scrcpy::KeyCodeCommand& cmd) = 0;
    virtual void injectText(const std::string& text) = 0;
    virtual void pressBackOrTurnOnScreen() = 0;
};

// Encoder probe + client construction, supplied by the protocol layer
struct ScrcpyBackend {
    std::function<Result<std::vector<std::string>, Error>(const ClientOptions&)> get_encoders;
    std::function<std::unique_ptr<ScrcpyClient>(const ClientOptions&)> create_client;
};

// =============================================================================
// Device file deployment
// =============================================================================

// (bytes written so far)
using SyncProgressCallback = std::function<void(uint64_t uploaded)>;

class AdbSync {
public:
    virtual ~AdbSync() = default;
    virtual Result<void, Error> write(const std::string& path,
                                      const std::vector<uint8_t>& buffer,
                                      const SyncProgressCallback& on_progress) = 0;
};

class AdbDevice {
public:
    virtual ~AdbDevice() = default;
    virtual std::string serial() const = 0;
    virtual Result<std::unique_ptr<AdbSync>, Error> sync() = 0;
};

// =============================================================================
// Server binary retrieval
// =============================================================================

// (downloaded, total)
using FetchProgressCallback = std::function<void(uint64_t downloaded, uint64_t total)>;
using ServerFetcher = std::function<Result<std::vector<uint8_t>, Error>(const FetchProgressCallback&)>;

// Reads the server jar from a local path in chunks, reporting progress.
ServerFetcher fetchServerFromFile(std::string path, size_t chunk_size = 64 * 1024);

} // namespace mirador
