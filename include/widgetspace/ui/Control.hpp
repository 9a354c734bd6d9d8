#pragma once

#include <widgetspace/ui/DrawingContext.hpp>
#include <widgetspace/ui/Event.hpp>
#include <widgetspace/ui/Style.hpp>
#include <widgetspace/ui/Widget.hpp>

#include <memory>
#include <optional>
#include <string_view>

namespace WS::UI {

/*
 * Contract every node variant implements. A variant embeds a Widget and exposes it
 * through widget(); everything else has a default.
 *
 * measure()/arrange() implement the two layout passes and delegate the child
 * layout step to measure_override()/arrange_override().
 */
class Control {
public:
    virtual ~Control() = default;

    [[nodiscard]] virtual auto widget() -> Widget&             = 0;
    [[nodiscard]] virtual auto widget() const -> Widget const& = 0;

    // Default: componentwise max of the children's desired sizes.
    virtual auto measure_override(UserInterface& ui, Vec2 available_size) -> Vec2;
    // Default: every child gets the full final size at the local origin.
    virtual auto arrange_override(UserInterface& ui, Vec2 final_size) -> Vec2;

    auto measure(UserInterface& ui, Vec2 available_size) -> void;
    auto arrange(UserInterface& ui, Rect const& final_rect) -> void;

    virtual auto draw(DrawingContext& drawing_context) -> void;
    virtual auto update(float dt) -> void;

    /*
     * Reacts to a routed event. The node has been moved out of the arena for the
     * duration of the call: borrowing it through self_handle throws. Use
     * self_handle only to compare against event source/target or to capture input.
     */
    virtual auto handle_event(NodeHandle self_handle, UserInterface& ui, UIEvent& event) -> void;

    virtual auto set_property(std::string_view name, PropertyValue const& value) -> bool;
    [[nodiscard]] virtual auto get_property(std::string_view name) const -> std::optional<PropertyValue>;

    // Base chain first, then the style's own setters in order.
    auto apply_style(std::shared_ptr<Style const> const& style) -> void;
};

// Window-sized root of every tree. Default layout, draws nothing.
class Canvas : public Control {
public:
    Canvas() = default;
    explicit Canvas(Widget widget)
        : widget_(std::move(widget)) {}

    [[nodiscard]] auto widget() -> Widget& override { return widget_; }
    [[nodiscard]] auto widget() const -> Widget const& override { return widget_; }

private:
    Widget widget_{};
};

} // namespace WS::UI
