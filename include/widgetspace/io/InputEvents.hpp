#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace WS::IO {

enum class MouseButton : std::uint8_t {
    Left = 0,
    Right,
    Middle,
    Back,
    Forward,
    Other
};

enum class ButtonModifiers : std::uint32_t {
    None    = 0,
    Shift   = 1u << 0,
    Control = 1u << 1,
    Alt     = 1u << 2,
    Command = 1u << 3
};

[[nodiscard]] constexpr auto operator|(ButtonModifiers lhs, ButtonModifiers rhs) -> ButtonModifiers {
    return static_cast<ButtonModifiers>(static_cast<std::uint32_t>(lhs) |
                                        static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] constexpr auto operator&(ButtonModifiers lhs, ButtonModifiers rhs) -> ButtonModifiers {
    return static_cast<ButtonModifiers>(static_cast<std::uint32_t>(lhs) &
                                        static_cast<std::uint32_t>(rhs));
}

[[nodiscard]] constexpr auto hasModifier(ButtonModifiers value, ButtonModifiers flag) -> bool {
    return (value & flag) != ButtonModifiers::None;
}

enum class KeyCode : std::uint16_t {
    A, B, C, D, E, F, G, H, I, J, K, L, M,
    N, O, P, Q, R, S, T, U, V, W, X, Y, Z,
    Key0, Key1, Key2, Key3, Key4, Key5, Key6, Key7, Key8, Key9,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    Escape,
    Tab,
    Space,
    Enter,
    Backspace,
    Delete,
    Insert,
    Home,
    End,
    PageUp,
    PageDown,
    Left,
    Up,
    Right,
    Down,
    LShift,
    RShift,
    LControl,
    RControl,
    LAlt,
    RAlt
};

[[nodiscard]] auto key_code_name(KeyCode code) -> std::string_view;
[[nodiscard]] auto mouse_button_name(MouseButton button) -> std::string_view;

struct MouseButtonInput {
    MouseButton button  = MouseButton::Left;
    bool        pressed = false;
};

// Position in window pixels, already mapped to the UI's coordinate space.
struct CursorMoved {
    float x = 0.0f;
    float y = 0.0f;
};

struct LineDelta {
    float x = 0.0f;
    float y = 0.0f;
};

struct PixelDelta {
    float x = 0.0f;
    float y = 0.0f;
};

struct MouseWheel {
    std::variant<LineDelta, PixelDelta> delta{LineDelta{}};
};

struct KeyboardInput {
    bool                   pressed = false;
    std::optional<KeyCode> key{};      // absent when the platform scancode has no mapping
    std::uint32_t          scancode = 0;
    ButtonModifiers        modifiers = ButtonModifiers::None;
};

struct ReceivedCharacter {
    char32_t codepoint = 0;
};

struct Resized {
    std::uint32_t width  = 0;
    std::uint32_t height = 0;
};

struct FocusChanged {
    bool focused = false;
};

struct CloseRequested {};

using InputEvent = std::variant<MouseButtonInput,
                                CursorMoved,
                                MouseWheel,
                                KeyboardInput,
                                ReceivedCharacter,
                                Resized,
                                FocusChanged,
                                CloseRequested>;

} // namespace WS::IO
