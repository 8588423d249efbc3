// =============================================================================
// Mirador - scrcpy Control Types
// =============================================================================
// Protocol-level values handed to the scrcpy client. Numeric values match the
// Android framework constants (KeyEvent / MotionEvent / MediaCodecInfo).
// The byte encoding of these commands belongs to the client, not to Mirador.
// =============================================================================
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace mirador::scrcpy {

// Protocol pressure is a 16-bit fixed-point value
static constexpr uint32_t PRESSURE_MAX = 65535;

enum class AndroidMotionEventAction : uint8_t {
    Down = 0,
    Up   = 1,
    Move = 2,
};

enum class AndroidKeyCode : uint32_t {
    Home          = 3,
    DpadUp        = 19,
    DpadDown      = 20,
    DpadLeft      = 21,
    DpadRight     = 22,
    Tab           = 61,
    Enter         = 66,
    Delete        = 67,   // backspace
    ForwardDelete = 112,
    AppSwitch     = 187,
};

enum class ScrcpyLogLevel {
    Debug,
    Info,
    Warn,
    Error,
};

enum class ScrcpyScreenOrientation : int {
    Unlocked = -1,
    Portrait = 0,
    Landscape = 1,
    PortraitFlipped = 2,
    LandscapeFlipped = 3,
};

enum class AndroidCodecProfile : uint32_t {
    Baseline = 0x01,
    Main     = 0x02,
    High     = 0x08,
};

enum class AndroidCodecLevel : uint32_t {
    Level31 = 0x200,
    Level4  = 0x800,
    Level41 = 0x1000,
    Level42 = 0x2000,
};

inline ScrcpyLogLevel parseLogLevel(const std::string& name) {
    if (name == "debug") return ScrcpyLogLevel::Debug;
    if (name == "warn")  return ScrcpyLogLevel::Warn;
    if (name == "error") return ScrcpyLogLevel::Error;
    return ScrcpyLogLevel::Info;
}

// Touch injection (one PointerContact sample)
struct TouchCommand {
    AndroidMotionEventAction action = AndroidMotionEventAction::Down;
    uint64_t pointer_id = 0;
    float pointer_x = 0.0f;     // device-screen coordinates
    float pointer_y = 0.0f;
    uint32_t pressure = 0;      // 0..PRESSURE_MAX
    uint32_t buttons = 0;
};

struct KeyCodeCommand {
    AndroidKeyCode key_code = AndroidKeyCode::Home;
    uint32_t repeat = 0;
    uint32_t meta_state = 0;
};

struct TextCommand {
    std::string text;
};

// Stream geometry reported by the server, plus the opaque decoder
// configuration (SPS/PPS) the decoder needs to reinitialize.
struct VideoGeometry {
    int width = 0;
    int height = 0;
    int cropped_width = 0;
    int cropped_height = 0;
    std::vector<uint8_t> codec_config;
};

} // namespace mirador::scrcpy
