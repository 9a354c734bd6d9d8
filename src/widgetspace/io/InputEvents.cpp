#include <widgetspace/io/InputEvents.hpp>

#include <array>

namespace WS::IO {

namespace {

constexpr std::array<std::string_view, 69> kKeyNames{
    "A", "B", "C", "D", "E", "F", "G", "H", "I", "J", "K", "L", "M",
    "N", "O", "P", "Q", "R", "S", "T", "U", "V", "W", "X", "Y", "Z",
    "0", "1", "2", "3", "4", "5", "6", "7", "8", "9",
    "F1", "F2", "F3", "F4", "F5", "F6", "F7", "F8", "F9", "F10", "F11", "F12",
    "Escape", "Tab", "Space", "Enter", "Backspace", "Delete", "Insert",
    "Home", "End", "PageUp", "PageDown",
    "Left", "Up", "Right", "Down",
    "LShift", "RShift", "LControl", "RControl", "LAlt", "RAlt",
};

static_assert(kKeyNames.size() == static_cast<std::size_t>(KeyCode::RAlt) + 1);

} // namespace

auto key_code_name(KeyCode code) -> std::string_view {
    auto const index = static_cast<std::size_t>(code);
    if (index >= kKeyNames.size()) {
        return "Unknown";
    }
    return kKeyNames[index];
}

auto mouse_button_name(MouseButton button) -> std::string_view {
    switch (button) {
    case MouseButton::Left:
        return "left";
    case MouseButton::Right:
        return "right";
    case MouseButton::Middle:
        return "middle";
    case MouseButton::Back:
        return "back";
    case MouseButton::Forward:
        return "forward";
    case MouseButton::Other:
        return "other";
    }
    return "other";
}

} // namespace WS::IO
