#include "input_mapper.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace mirador::input {

namespace {

// Named keys delivered as discrete key codes
const std::map<std::string, scrcpy::AndroidKeyCode>& keyTable() {
    static const std::map<std::string, scrcpy::AndroidKeyCode> table = {
        {"Backspace",  scrcpy::AndroidKeyCode::Delete},
        {"Delete",     scrcpy::AndroidKeyCode::ForwardDelete},
        {"Enter",      scrcpy::AndroidKeyCode::Enter},
        {"Tab",        scrcpy::AndroidKeyCode::Tab},
        {"ArrowUp",    scrcpy::AndroidKeyCode::DpadUp},
        {"ArrowDown",  scrcpy::AndroidKeyCode::DpadDown},
        {"ArrowLeft",  scrcpy::AndroidKeyCode::DpadLeft},
        {"ArrowRight", scrcpy::AndroidKeyCode::DpadRight},
    };
    return table;
}

scrcpy::TouchCommand makeTouch(scrcpy::AndroidMotionEventAction action,
                               const PointerEvent& event,
                               const ScreenPoint& point) {
    scrcpy::TouchCommand cmd;
    cmd.action = action;
    cmd.pointer_id = event.pointer_id;
    cmd.pointer_x = point.x;
    cmd.pointer_y = point.y;
    cmd.pressure = pressureToProtocolUnits(event.pressure);
    cmd.buttons = 0;
    return cmd;
}

} // namespace

std::optional<ScreenPoint> pointerToScreen(float client_x, float client_y,
                                           const SurfaceBounds& bounds,
                                           const StreamSize& stream) {
    if (!stream.valid() || bounds.width <= 0.0f || bounds.height <= 0.0f) {
        return std::nullopt;
    }

    float view_x = client_x - bounds.left;
    float view_y = client_y - bounds.top;

    float rel_x = std::clamp(view_x / bounds.width, 0.0f, 1.0f);
    float rel_y = std::clamp(view_y / bounds.height, 0.0f, 1.0f);

    return ScreenPoint{rel_x * static_cast<float>(stream.width),
                       rel_y * static_cast<float>(stream.height)};
}

uint32_t pressureToProtocolUnits(float pressure) {
    if (std::isnan(pressure)) return 0;
    float p = std::clamp(pressure, 0.0f, 1.0f);
    return static_cast<uint32_t>(std::lround(static_cast<double>(p) * scrcpy::PRESSURE_MAX));
}

std::optional<PointerMapping> mapPointerEvent(const PointerEvent& event,
                                              const SurfaceBounds& bounds,
                                              const StreamSize& stream) {
    scrcpy::AndroidMotionEventAction action = scrcpy::AndroidMotionEventAction::Down;
    PointerCapture capture = PointerCapture::None;

    switch (event.type) {
        case PointerEventType::Down:
            if (event.button != PRIMARY_BUTTON) return std::nullopt;
            action = scrcpy::AndroidMotionEventAction::Down;
            capture = PointerCapture::Acquire;
            break;
        case PointerEventType::Move:
            // Only while exactly the primary button is held
            if (event.buttons != PRIMARY_BUTTON_MASK) return std::nullopt;
            action = scrcpy::AndroidMotionEventAction::Move;
            break;
        case PointerEventType::Up:
            if (event.button != PRIMARY_BUTTON) return std::nullopt;
            action = scrcpy::AndroidMotionEventAction::Up;
            capture = PointerCapture::Release;
            break;
        case PointerEventType::Cancel:
            // The contact is gone; lift it on the device as well
            action = scrcpy::AndroidMotionEventAction::Up;
            capture = PointerCapture::Release;
            break;
        default:
            return std::nullopt;
    }

    auto point = pointerToScreen(event.client_x, event.client_y, bounds, stream);
    if (!point) return std::nullopt;

    PointerMapping mapping;
    mapping.touch = makeTouch(action, event, *point);
    mapping.capture = capture;
    return mapping;
}

bool isSingleAlphanumeric(const std::string& key) {
    if (key.size() != 1) return false;
    char c = key[0];
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

std::optional<scrcpy::AndroidKeyCode> namedKeyCode(const std::string& key) {
    const auto& table = keyTable();
    auto it = table.find(key);
    if (it == table.end()) return std::nullopt;
    return it->second;
}

std::optional<KeyMapping> mapKey(const std::string& key) {
    if (isSingleAlphanumeric(key)) {
        return KeyMapping{scrcpy::TextCommand{key}};
    }

    auto code = namedKeyCode(key);
    if (!code) return std::nullopt;

    scrcpy::KeyCodeCommand cmd;
    cmd.key_code = *code;
    cmd.repeat = 0;
    cmd.meta_state = 0;
    return KeyMapping{cmd};
}

std::optional<scrcpy::KeyCodeCommand> navButtonKeyCode(NavButton button) {
    scrcpy::KeyCodeCommand cmd;
    switch (button) {
        case NavButton::Home:
            cmd.key_code = scrcpy::AndroidKeyCode::Home;
            return cmd;
        case NavButton::AppSwitch:
            cmd.key_code = scrcpy::AndroidKeyCode::AppSwitch;
            return cmd;
        case NavButton::Back:
            break;
    }
    return std::nullopt;
}

} // namespace mirador::input
