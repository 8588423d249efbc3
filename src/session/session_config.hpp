#pragma once

#include <memory>
#include <optional>
#include <string>

#include "../scrcpy_client.hpp"
#include "../video/decoder.hpp"

namespace mirador {

static constexpr const char* DEFAULT_SERVER_PATH = "/data/local/tmp/scrcpy-server.jar";
static constexpr const char* DEFAULT_SERVER_VERSION = "1.19";

/**
 * Everything one session needs, captured by value when start() is called.
 * Edits made while a session runs only affect the next start().
 */
struct SessionConfig {
    std::shared_ptr<AdbDevice> device;
    std::optional<video::DecoderDescriptor> decoder;

    std::string encoder;               // preferred; replaced if the device does not offer it
    int max_size = 1080;               // longer side, 0 = unlimited
    int bit_rate = 4000000;
    bool tunnel_forward = false;       // true: client connects to device

    std::string server_path = DEFAULT_SERVER_PATH;
    std::string server_version = DEFAULT_SERVER_VERSION;
    scrcpy::ScrcpyLogLevel log_level = scrcpy::ScrcpyLogLevel::Debug;

    // Software decoders only handle Baseline
    scrcpy::AndroidCodecProfile profile = scrcpy::AndroidCodecProfile::Baseline;
    scrcpy::AndroidCodecLevel level = scrcpy::AndroidCodecLevel::Level4;
    scrcpy::ScrcpyScreenOrientation orientation = scrcpy::ScrcpyScreenOrientation::Unlocked;
};

// Options for the encoder probe and for the real client
inline ClientOptions makeClientOptions(const SessionConfig& config, const std::string& encoder) {
    ClientOptions options;
    options.device = config.device;
    options.server_path = config.server_path;
    options.server_version = config.server_version;
    options.log_level = config.log_level;
    options.max_size = config.max_size;
    options.bit_rate = config.bit_rate;
    options.encoder = encoder;
    options.tunnel_forward = config.tunnel_forward;
    options.orientation = config.orientation;
    options.profile = config.profile;
    options.level = config.level;
    return options;
}

} // namespace mirador
