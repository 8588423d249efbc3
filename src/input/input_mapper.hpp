// =============================================================================
// Mirador - Input Mapper
// =============================================================================
// Pure conversion of viewport pointer/keyboard events into scrcpy input
// commands. Holds no state: the surface bounds and the current stream size
// are passed in on every call, so any UI thread may call these directly.
// =============================================================================
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "../scrcpy_protocol.hpp"

namespace mirador::input {

// On-screen rectangle of the render surface (presentation coordinates)
struct SurfaceBounds {
    float left = 0.0f;
    float top = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
};

// Cropped video size reported by the server
struct StreamSize {
    int width = 0;
    int height = 0;

    bool valid() const { return width > 0 && height > 0; }
    bool operator==(const StreamSize& o) const { return width == o.width && height == o.height; }
    bool operator!=(const StreamSize& o) const { return !(*this == o); }
};

struct ScreenPoint {
    float x = 0.0f;
    float y = 0.0f;
};

enum class PointerEventType { Down, Move, Up, Cancel };

// DOM-style pointer event: `button` is the button that changed state
// (0 = primary, -1 = none), `buttons` is the mask of buttons held.
struct PointerEvent {
    PointerEventType type = PointerEventType::Down;
    uint64_t pointer_id = 0;
    float client_x = 0.0f;
    float client_y = 0.0f;
    int button = 0;
    uint32_t buttons = 0;
    float pressure = 0.0f;     // 0..1
};

static constexpr int PRIMARY_BUTTON = 0;
static constexpr uint32_t PRIMARY_BUTTON_MASK = 1;

// What the presentation layer must do with pointer capture for this event
enum class PointerCapture { None, Acquire, Release };

struct PointerMapping {
    scrcpy::TouchCommand touch;
    PointerCapture capture = PointerCapture::None;
};

// Text goes to the remote IME, key codes to the remote key-event path
using KeyMapping = std::variant<scrcpy::TextCommand, scrcpy::KeyCodeCommand>;

enum class NavButton { Back, Home, AppSwitch };

// Presentation -> device transform. Positions outside the surface are
// clamped to its edge. nullopt when the surface or the stream has no area.
std::optional<ScreenPoint> pointerToScreen(float client_x, float client_y,
                                           const SurfaceBounds& bounds,
                                           const StreamSize& stream);

// round(p * 65535), p clamped to [0, 1]
uint32_t pressureToProtocolUnits(float pressure);

// Primary button only. nullopt for events that produce no touch command.
std::optional<PointerMapping> mapPointerEvent(const PointerEvent& event,
                                              const SurfaceBounds& bounds,
                                              const StreamSize& stream);

// Key names follow KeyboardEvent.key ("a", "7", "Backspace", "Enter", ...)
std::optional<KeyMapping> mapKey(const std::string& key);

std::optional<scrcpy::AndroidKeyCode> namedKeyCode(const std::string& key);

bool isSingleAlphanumeric(const std::string& key);

// Home and AppSwitch map to key codes; Back is sent as
// pressBackOrTurnOnScreen by the controller and has no key command.
std::optional<scrcpy::KeyCodeCommand> navButtonKeyCode(NavButton button);

} // namespace mirador::input
