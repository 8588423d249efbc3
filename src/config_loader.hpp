#pragma once
// =============================================================================
// Mirador Config Loader
// =============================================================================
// Loads settings from mirador.json with nlohmann/json.
// Missing file, missing keys or wrong types fall back to defaults.
// =============================================================================

#include <fstream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "mirador_log.hpp"
#include "session/session_config.hpp"
#include "video/decoder.hpp"

namespace mirador {
namespace config {

struct SessionDefaults {
    std::string server_path = DEFAULT_SERVER_PATH;
    std::string server_version = DEFAULT_SERVER_VERSION;
    std::string server_log_level = "debug";
    int max_size = 1080;
    int bit_rate = 4000000;
    bool tunnel_forward = false;
    std::string encoder;          // empty = first encoder the device reports
    std::string decoder;          // empty = first registered decoder
};

struct ServerConfig {
    std::string local_path = "scrcpy-server.jar";   // server binary on this machine
};

struct LogConfig {
    std::string log_path = "mirador.log";
    std::string level = "info";
};

struct AppConfig {
    SessionDefaults session;
    ServerConfig server;
    LogConfig log;
};

// Spin-box ranges of the settings panel
static constexpr int MAX_SIZE_LIMIT = 2560;
static constexpr int BIT_RATE_MIN = 100;
static constexpr int BIT_RATE_MAX = 10000000;

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    try {
        if (j.contains(section) && j[section].contains(key)) {
            return j[section][key].get<T>();
        }
    } catch (const nlohmann::json::exception& e) {
        MLOG_WARN("config", "%s.%s: %s, using default", section.c_str(), key.c_str(), e.what());
    }
    return def;
}

inline int clampInt(int v, int lo, int hi) {
    return v < lo ? lo : (v > hi ? hi : v);
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "mirador.json",
                            bool strict = false) {
    AppConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("../mirador.json");
    }
    if (!file.is_open()) {
        MLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);

        const SessionDefaults d;
        config.session.server_path = jsonGet<std::string>(j, "session", "server_path", d.server_path);
        config.session.server_version = jsonGet<std::string>(j, "session", "server_version", d.server_version);
        config.session.server_log_level = jsonGet<std::string>(j, "session", "server_log_level", d.server_log_level);
        config.session.max_size = clampInt(jsonGet<int>(j, "session", "max_size", d.max_size), 0, MAX_SIZE_LIMIT);
        config.session.bit_rate = clampInt(jsonGet<int>(j, "session", "bit_rate", d.bit_rate), BIT_RATE_MIN, BIT_RATE_MAX);
        config.session.tunnel_forward = jsonGet<bool>(j, "session", "tunnel_forward", d.tunnel_forward);
        config.session.encoder = jsonGet<std::string>(j, "session", "encoder", d.encoder);
        config.session.decoder = jsonGet<std::string>(j, "session", "decoder", d.decoder);

        config.server.local_path = jsonGet<std::string>(j, "server", "local_path", "scrcpy-server.jar");

        config.log.log_path = jsonGet<std::string>(j, "log", "log_path", "mirador.log");
        config.log.level = jsonGet<std::string>(j, "log", "level", "info");

    } catch (const nlohmann::json::exception& e) {
        MLOG_ERROR("config", "JSON parse error: %s", e.what());
        return AppConfig{};
    }

    MLOG_INFO("config", "Loaded: server=%s v%s, max_size=%d, bit_rate=%d, forward=%d",
              config.session.server_path.c_str(),
              config.session.server_version.c_str(),
              config.session.max_size,
              config.session.bit_rate,
              config.session.tunnel_forward ? 1 : 0);

    return config;
}

// Applies the log section: minimum level and log file
inline bool applyLogConfig(const LogConfig& log_config) {
    mirador::log::setLogLevel(mirador::log::parseLevel(log_config.level));
    if (log_config.log_path.empty()) return true;
    if (!mirador::log::openLogFile(log_config.log_path.c_str())) {
        MLOG_WARN("config", "Cannot open log file %s", log_config.log_path.c_str());
        return false;
    }
    return true;
}

// Builds the per-session snapshot. An unknown decoder name falls back to the
// registry default; an empty registry leaves the decoder unset.
inline SessionConfig toSessionConfig(const AppConfig& app,
                                     std::shared_ptr<AdbDevice> device,
                                     const video::DecoderRegistry& decoders) {
    SessionConfig cfg;
    cfg.device = std::move(device);
    cfg.encoder = app.session.encoder;
    cfg.max_size = app.session.max_size;
    cfg.bit_rate = app.session.bit_rate;
    cfg.tunnel_forward = app.session.tunnel_forward;
    cfg.server_path = app.session.server_path;
    cfg.server_version = app.session.server_version;
    cfg.log_level = scrcpy::parseLogLevel(app.session.server_log_level);

    if (!app.session.decoder.empty()) {
        cfg.decoder = decoders.find(app.session.decoder);
        if (!cfg.decoder) {
            MLOG_WARN("config", "Decoder '%s' not available, using default",
                      app.session.decoder.c_str());
        }
    }
    if (!cfg.decoder) {
        cfg.decoder = decoders.defaultDecoder();
    }
    return cfg;
}

} // namespace config
} // namespace mirador
