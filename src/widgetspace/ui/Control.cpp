#include <widgetspace/ui/Control.hpp>
#include <widgetspace/ui/UserInterface.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>

namespace WS::UI {

namespace {

// Size offered to the children on one axis: explicit size wins, otherwise what is
// left of the available span after margins.
auto child_axis(bool has_explicit, float explicit_size, float available, float margin, float min_v, float max_v) -> float {
    auto const candidate = has_explicit ? non_negative(explicit_size) : non_negative(available - margin);
    return non_negative(clamp_to_bounds(candidate, min_v, max_v));
}

} // namespace

auto Control::measure_override(UserInterface& ui, Vec2 available_size) -> Vec2 {
    Vec2 size{};
    for (auto const child_handle : this->widget().children()) {
        auto& child = ui.node(child_handle);
        child.measure(ui, available_size);
        auto const child_desired = child.widget().desired_size();
        size.x = std::max(size.x, child_desired.x);
        size.y = std::max(size.y, child_desired.y);
    }
    return size;
}

auto Control::arrange_override(UserInterface& ui, Vec2 final_size) -> Vec2 {
    auto const final_rect = Rect{0.0f, 0.0f, final_size.x, final_size.y};
    for (auto const child_handle : this->widget().children()) {
        ui.node(child_handle).arrange(ui, final_rect);
    }
    return final_size;
}

auto Control::measure(UserInterface& ui, Vec2 available_size) -> void {
    auto& widget = this->widget();
    available_size = Vec2{non_negative(available_size.x), non_negative(available_size.y)};

    if (widget.visibility_ != Visibility::Visible) {
        widget.desired_size_  = Vec2{};
        widget.measure_valid_ = true;
        return;
    }

    auto const margin = widget.margin_.total();
    auto const size_for_child = Vec2{
        child_axis(widget.has_width(), widget.width_, available_size.x, margin.x, widget.min_size_.x, widget.max_size_.x),
        child_axis(widget.has_height(), widget.height_, available_size.y, margin.y, widget.min_size_.y, widget.max_size_.y),
    };

    auto desired = this->measure_override(ui, size_for_child);

    if (widget.has_width()) {
        desired.x = non_negative(widget.width_);
    }
    if (widget.has_height()) {
        desired.y = non_negative(widget.height_);
    }
    desired.x = non_negative(clamp_to_bounds(desired.x, widget.min_size_.x, widget.max_size_.x));
    desired.y = non_negative(clamp_to_bounds(desired.y, widget.min_size_.y, widget.max_size_.y));

    desired += margin;

    // Never ask for more than what was offered.
    desired.x = std::min(desired.x, available_size.x);
    desired.y = std::min(desired.y, available_size.y);

    widget.desired_size_  = desired;
    widget.measure_valid_ = true;
}

auto Control::arrange(UserInterface& ui, Rect const& final_rect) -> void {
    auto& widget = this->widget();

    if (widget.visibility_ != Visibility::Visible) {
        widget.actual_size_   = Vec2{};
        widget.arrange_valid_ = true;
        return;
    }

    auto const margin_x = widget.margin_.horizontal();
    auto const margin_y = widget.margin_.vertical();

    auto origin = Vec2{final_rect.x + widget.margin_.left, final_rect.y + widget.margin_.top};

    auto size = Vec2{non_negative(final_rect.w - margin_x), non_negative(final_rect.h - margin_y)};
    auto const size_without_margin = size;

    if (widget.horizontal_alignment_ != HorizontalAlignment::Stretch) {
        size.x = std::min(size.x, non_negative(widget.desired_size_.x - margin_x));
    }
    if (widget.vertical_alignment_ != VerticalAlignment::Stretch) {
        size.y = std::min(size.y, non_negative(widget.desired_size_.y - margin_y));
    }

    if (widget.has_width()) {
        size.x = non_negative(widget.width_);
    }
    if (widget.has_height()) {
        size.y = non_negative(widget.height_);
    }

    size = this->arrange_override(ui, size);

    size.x = std::min(non_negative(size.x), non_negative(final_rect.w));
    size.y = std::min(non_negative(size.y), non_negative(final_rect.h));

    switch (widget.horizontal_alignment_) {
    case HorizontalAlignment::Center:
    case HorizontalAlignment::Stretch:
        origin.x += (size_without_margin.x - size.x) * 0.5f;
        break;
    case HorizontalAlignment::Right:
        origin.x += size_without_margin.x - size.x;
        break;
    case HorizontalAlignment::Left:
        break;
    }

    switch (widget.vertical_alignment_) {
    case VerticalAlignment::Center:
    case VerticalAlignment::Stretch:
        origin.y += (size_without_margin.y - size.y) * 0.5f;
        break;
    case VerticalAlignment::Bottom:
        origin.y += size_without_margin.y - size.y;
        break;
    case VerticalAlignment::Top:
        break;
    }

    widget.actual_size_           = size;
    widget.actual_local_position_ = origin;
    widget.arrange_valid_         = true;
}

auto Control::draw(DrawingContext&) -> void {}

auto Control::update(float) -> void {}

auto Control::handle_event(NodeHandle, UserInterface&, UIEvent&) -> void {}

auto Control::set_property(std::string_view name, PropertyValue const& value) -> bool {
    return this->widget().set_property(name, value);
}

auto Control::get_property(std::string_view name) const -> std::optional<PropertyValue> {
    return this->widget().get_property(name);
}

auto Control::apply_style(std::shared_ptr<Style const> const& style) -> void {
    if (!style) {
        return;
    }
    if (auto const& base = style->base_style()) {
        this->apply_style(base);
    }

    this->widget().set_style(style);

    for (auto const& setter : style->setters()) {
        if (!this->set_property(setter.name, setter.value)) {
            ws_log("Style setter '" + setter.name + "' not accepted by node '" + this->widget().name() + "'", "Style");
        }
    }
}

} // namespace WS::UI
