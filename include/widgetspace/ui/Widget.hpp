#pragma once

#include <widgetspace/ui/Event.hpp>
#include <widgetspace/ui/Geometry.hpp>
#include <widgetspace/ui/Style.hpp>
#include <widgetspace/utils/PopFrontQueue.hpp>

#include <cmath>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace WS::UI {

enum class HorizontalAlignment {
    Stretch,
    Left,
    Center,
    Right
};

enum class VerticalAlignment {
    Stretch,
    Top,
    Center,
    Bottom
};

enum class Visibility {
    Visible,
    // Takes no space in layout and is not drawn.
    Collapsed,
    // Not drawn, but keeps its visibility slot in the tree.
    Hidden
};

[[nodiscard]] constexpr auto bool_to_visibility(bool value) -> Visibility {
    return value ? Visibility::Visible : Visibility::Collapsed;
}

[[nodiscard]] auto horizontal_alignment_name(HorizontalAlignment value) -> std::string_view;
[[nodiscard]] auto vertical_alignment_name(VerticalAlignment value) -> std::string_view;
[[nodiscard]] auto visibility_name(Visibility value) -> std::string_view;

// Half-open range of command indices a node emitted during the last draw.
struct CommandRange {
    std::size_t begin = 0;
    std::size_t end   = 0;

    [[nodiscard]] auto empty() const -> bool { return begin >= end; }
    [[nodiscard]] auto size() const -> std::size_t { return empty() ? 0 : end - begin; }
};

/*
 * Base state embedded in every node variant: tree links, layout inputs, the
 * results of the last measure/arrange/propagation pass, interaction flags and the
 * node's outgoing event queue.
 *
 * Layout results are written only by Control and UserInterface.
 */
class Widget {
public:
    Widget() = default;

    [[nodiscard]] auto name() const -> std::string const& { return name_; }
    auto set_name(std::string name) -> Widget& {
        name_ = std::move(name);
        return *this;
    }

    [[nodiscard]] auto parent() const -> NodeHandle { return parent_; }
    [[nodiscard]] auto children() const -> std::vector<NodeHandle> const& { return children_; }

    [[nodiscard]] auto width() const -> float { return width_; }
    [[nodiscard]] auto height() const -> float { return height_; }
    [[nodiscard]] auto has_width() const -> bool { return !std::isnan(width_); }
    [[nodiscard]] auto has_height() const -> bool { return !std::isnan(height_); }
    [[nodiscard]] auto min_size() const -> Vec2 { return min_size_; }
    [[nodiscard]] auto max_size() const -> Vec2 { return max_size_; }
    [[nodiscard]] auto margin() const -> Thickness const& { return margin_; }
    [[nodiscard]] auto horizontal_alignment() const -> HorizontalAlignment { return horizontal_alignment_; }
    [[nodiscard]] auto vertical_alignment() const -> VerticalAlignment { return vertical_alignment_; }
    [[nodiscard]] auto visibility() const -> Visibility { return visibility_; }
    [[nodiscard]] auto is_hit_test_visible() const -> bool { return is_hit_test_visible_; }
    [[nodiscard]] auto background() const -> Color { return background_; }
    [[nodiscard]] auto foreground() const -> Color { return foreground_; }

    // NaN clears the explicit size.
    auto set_width(float width) -> Widget&;
    auto set_height(float height) -> Widget&;
    auto set_min_size(Vec2 size) -> Widget&;
    auto set_max_size(Vec2 size) -> Widget&;
    auto set_margin(Thickness margin) -> Widget&;
    auto set_horizontal_alignment(HorizontalAlignment alignment) -> Widget&;
    auto set_vertical_alignment(VerticalAlignment alignment) -> Widget&;
    auto set_visibility(Visibility visibility) -> Widget&;
    auto set_hit_test_visibility(bool visible) -> Widget&;
    auto set_background(Color color) -> Widget&;
    auto set_foreground(Color color) -> Widget&;

    [[nodiscard]] auto desired_size() const -> Vec2 { return desired_size_; }
    [[nodiscard]] auto actual_size() const -> Vec2 { return actual_size_; }
    [[nodiscard]] auto actual_local_position() const -> Vec2 { return actual_local_position_; }
    [[nodiscard]] auto screen_position() const -> Vec2 { return screen_position_; }
    [[nodiscard]] auto screen_bounds() const -> Rect { return Rect::from(screen_position_, actual_size_); }
    [[nodiscard]] auto global_visibility() const -> bool { return global_visibility_; }
    [[nodiscard]] auto is_mouse_over() const -> bool { return is_mouse_over_; }
    [[nodiscard]] auto is_measure_valid() const -> bool { return measure_valid_; }
    [[nodiscard]] auto is_arrange_valid() const -> bool { return arrange_valid_; }
    [[nodiscard]] auto command_range() const -> CommandRange { return command_range_; }

    auto post_event(UIEvent event) -> void { events_.push_back(std::move(event)); }
    [[nodiscard]] auto pending_event_count() const -> std::size_t { return events_.size(); }

    [[nodiscard]] auto style() const -> std::shared_ptr<Style const> const& { return style_; }
    auto set_style(std::shared_ptr<Style const> style) -> void { style_ = std::move(style); }

    // Named access to the fields above, used by style setters.
    auto set_property(std::string_view name, PropertyValue const& value) -> bool;
    [[nodiscard]] auto get_property(std::string_view name) const -> std::optional<PropertyValue>;

private:
    friend class Control;
    friend class UserInterface;
    friend class WidgetBuilder;

    auto invalidate_layout() -> void {
        measure_valid_ = false;
        arrange_valid_ = false;
    }

    std::string             name_;
    NodeHandle              parent_{};
    std::vector<NodeHandle> children_{};

    float               width_                = kUnset;
    float               height_               = kUnset;
    Vec2                min_size_{0.0f, 0.0f};
    Vec2                max_size_{kUnbounded, kUnbounded};
    Thickness           margin_{};
    HorizontalAlignment horizontal_alignment_ = HorizontalAlignment::Stretch;
    VerticalAlignment   vertical_alignment_   = VerticalAlignment::Stretch;

    Vec2 desired_size_{};
    Vec2 actual_size_{};
    Vec2 actual_local_position_{};
    Vec2 screen_position_{};

    Visibility visibility_          = Visibility::Visible;
    bool       global_visibility_   = true;
    bool       is_hit_test_visible_ = true;
    bool       is_mouse_over_       = false;
    bool       measure_valid_       = false;
    bool       arrange_valid_       = false;

    Color background_ = Colors::Transparent;
    Color foreground_ = Colors::White;

    PopFrontQueue<UIEvent>       events_{};
    CommandRange                 command_range_{};
    std::shared_ptr<Style const> style_{};
};

class WidgetBuilder {
public:
    WidgetBuilder() = default;

    auto with_name(std::string name) -> WidgetBuilder&;
    auto with_width(float width) -> WidgetBuilder&;
    auto with_height(float height) -> WidgetBuilder&;
    auto with_min_size(Vec2 size) -> WidgetBuilder&;
    auto with_max_size(Vec2 size) -> WidgetBuilder&;
    auto with_margin(Thickness margin) -> WidgetBuilder&;
    auto with_horizontal_alignment(HorizontalAlignment alignment) -> WidgetBuilder&;
    auto with_vertical_alignment(VerticalAlignment alignment) -> WidgetBuilder&;
    auto with_visibility(Visibility visibility) -> WidgetBuilder&;
    auto with_hit_test_visibility(bool visible) -> WidgetBuilder&;
    auto with_background(Color color) -> WidgetBuilder&;
    auto with_foreground(Color color) -> WidgetBuilder&;
    // Linked under the node when it is added to a UserInterface.
    auto with_child(NodeHandle child) -> WidgetBuilder&;
    auto with_children(std::vector<NodeHandle> const& children) -> WidgetBuilder&;

    [[nodiscard]] auto build() const -> Widget;

private:
    Widget widget_{};
};

} // namespace WS::UI
