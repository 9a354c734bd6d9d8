#pragma once

#include <widgetspace/core/Handle.hpp>
#include <widgetspace/io/InputEvents.hpp>
#include <widgetspace/ui/Geometry.hpp>

#include <any>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace WS::UI {

class Control;
class UserInterface;

using UINode     = std::unique_ptr<Control>;
using NodeHandle = Handle<UINode>;

namespace EventKinds {

struct MouseDown {
    Vec2            position{};
    IO::MouseButton button = IO::MouseButton::Left;
};

struct MouseUp {
    Vec2            position{};
    IO::MouseButton button = IO::MouseButton::Left;
};

struct MouseMove {
    Vec2 position{};
};

struct MouseEnter {};

struct MouseLeave {};

struct MouseWheel {
    Vec2  position{};
    float amount = 0.0f;
};

struct KeyDown {
    IO::KeyCode         code      = IO::KeyCode::A;
    IO::ButtonModifiers modifiers = IO::ButtonModifiers::None;
};

struct KeyUp {
    IO::KeyCode         code      = IO::KeyCode::A;
    IO::ButtonModifiers modifiers = IO::ButtonModifiers::None;
};

struct Text {
    char32_t symbol = 0;
};

// Open-ended kind for widget-defined events (clicks, open/close requests, ...).
struct Custom {
    std::string name;
    std::any    payload;
};

} // namespace EventKinds

using UIEventKind = std::variant<EventKinds::MouseDown,
                                 EventKinds::MouseUp,
                                 EventKinds::MouseMove,
                                 EventKinds::MouseEnter,
                                 EventKinds::MouseLeave,
                                 EventKinds::MouseWheel,
                                 EventKinds::KeyDown,
                                 EventKinds::KeyUp,
                                 EventKinds::Text,
                                 EventKinds::Custom>;

[[nodiscard]] auto event_kind_name(UIEventKind const& kind) -> std::string_view;

struct UIEvent {
    UIEventKind kind{EventKinds::MouseEnter{}};
    NodeHandle  source{};
    NodeHandle  target{};
    bool        handled = false;

    [[nodiscard]] static auto from(NodeHandle source, UIEventKind kind) -> UIEvent {
        return UIEvent{.kind = std::move(kind), .source = source, .target = NodeHandle{}, .handled = false};
    }

    [[nodiscard]] static auto targeted(NodeHandle target, UIEventKind kind) -> UIEvent {
        return UIEvent{.kind = std::move(kind), .source = NodeHandle{}, .target = target, .handled = false};
    }

    template <typename K>
    [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<K>(kind);
    }

    template <typename K>
    [[nodiscard]] auto get_if() -> K* {
        return std::get_if<K>(&kind);
    }

    template <typename K>
    [[nodiscard]] auto get_if() const -> K const* {
        return std::get_if<K>(&kind);
    }
};

} // namespace WS::UI
