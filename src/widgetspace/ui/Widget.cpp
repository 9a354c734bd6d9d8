#include <widgetspace/ui/Widget.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>

namespace WS::UI {

namespace {

auto as_float(PropertyValue const& value) -> std::optional<float> {
    if (auto const* v = std::any_cast<float>(&value)) {
        return *v;
    }
    if (auto const* v = std::any_cast<double>(&value)) {
        return static_cast<float>(*v);
    }
    if (auto const* v = std::any_cast<int>(&value)) {
        return static_cast<float>(*v);
    }
    if (auto const* v = std::any_cast<std::int64_t>(&value)) {
        return static_cast<float>(*v);
    }
    return std::nullopt;
}

auto as_string(PropertyValue const& value) -> std::optional<std::string_view> {
    if (auto const* v = std::any_cast<std::string>(&value)) {
        return std::string_view{*v};
    }
    if (auto const* v = std::any_cast<std::string_view>(&value)) {
        return *v;
    }
    if (auto const* v = std::any_cast<char const*>(&value)) {
        return std::string_view{*v};
    }
    return std::nullopt;
}

template <typename T>
auto as_exact(PropertyValue const& value) -> std::optional<T> {
    if (auto const* v = std::any_cast<T>(&value)) {
        return *v;
    }
    return std::nullopt;
}

auto as_thickness(PropertyValue const& value) -> std::optional<Thickness> {
    if (auto v = as_exact<Thickness>(value)) {
        return v;
    }
    if (auto uniform = as_float(value)) {
        return Thickness::uniform(*uniform);
    }
    return std::nullopt;
}

auto as_horizontal_alignment(PropertyValue const& value) -> std::optional<HorizontalAlignment> {
    if (auto v = as_exact<HorizontalAlignment>(value)) {
        return v;
    }
    auto name = as_string(value);
    if (!name) {
        return std::nullopt;
    }
    for (auto candidate : {HorizontalAlignment::Stretch, HorizontalAlignment::Left,
                           HorizontalAlignment::Center, HorizontalAlignment::Right}) {
        if (horizontal_alignment_name(candidate) == *name) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto as_vertical_alignment(PropertyValue const& value) -> std::optional<VerticalAlignment> {
    if (auto v = as_exact<VerticalAlignment>(value)) {
        return v;
    }
    auto name = as_string(value);
    if (!name) {
        return std::nullopt;
    }
    for (auto candidate : {VerticalAlignment::Stretch, VerticalAlignment::Top,
                           VerticalAlignment::Center, VerticalAlignment::Bottom}) {
        if (vertical_alignment_name(candidate) == *name) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto as_visibility(PropertyValue const& value) -> std::optional<Visibility> {
    if (auto v = as_exact<Visibility>(value)) {
        return v;
    }
    if (auto flag = as_exact<bool>(value)) {
        return bool_to_visibility(*flag);
    }
    auto name = as_string(value);
    if (!name) {
        return std::nullopt;
    }
    for (auto candidate : {Visibility::Visible, Visibility::Collapsed, Visibility::Hidden}) {
        if (visibility_name(candidate) == *name) {
            return candidate;
        }
    }
    return std::nullopt;
}

struct PropertyAccessor {
    bool (*set)(Widget&, PropertyValue const&);
    std::optional<PropertyValue> (*get)(Widget const&);
};

using PropertyTable = phmap::flat_hash_map<std::string_view, PropertyAccessor>;

template <typename T, typename Convert, typename Apply>
auto assign_with(Widget& widget, PropertyValue const& value, Convert convert, Apply apply) -> bool {
    std::optional<T> converted = convert(value);
    if (!converted) {
        return false;
    }
    apply(widget, *converted);
    return true;
}

auto property_table() -> PropertyTable const& {
    static PropertyTable const table{
        {"name",
         {[](Widget& w, PropertyValue const& v) {
              auto s = as_string(v);
              if (!s) {
                  return false;
              }
              w.set_name(std::string{*s});
              return true;
          },
          [](Widget const& w) -> std::optional<PropertyValue> { return PropertyValue{w.name()}; }}},
        {"width",
         {[](Widget& w, PropertyValue const& v) {
              return assign_with<float>(w, v, as_float, [](Widget& t, float f) { t.set_width(f); });
          },
          [](Widget const& w) -> std::optional<PropertyValue> { return PropertyValue{w.width()}; }}},
        {"height",
         {[](Widget& w, PropertyValue const& v) {
              return assign_with<float>(w, v, as_float, [](Widget& t, float f) { t.set_height(f); });
          },
          [](Widget const& w) -> std::optional<PropertyValue> { return PropertyValue{w.height()}; }}},
        {"min_size",
         {[](Widget& w, PropertyValue const& v) {
              return assign_with<Vec2>(w, v, as_exact<Vec2>, [](Widget& t, Vec2 s) { t.set_min_size(s); });
          },
          [](Widget const& w) -> std::optional<PropertyValue> { return PropertyValue{w.min_size()}; }}},
        {"max_size",
         {[](Widget& w, PropertyValue const& v) {
              return assign_with<Vec2>(w, v, as_exact<Vec2>, [](Widget& t, Vec2 s) { t.set_max_size(s); });
          },
          [](Widget const& w) -> std::optional<PropertyValue> { return PropertyValue{w.max_size()}; }}},
        {"margin",
         {[](Widget& w, PropertyValue const& v) {
              return assign_with<Thickness>(w, v, as_thickness, [](Widget& t, Thickness m) { t.set_margin(m); });
          },
          [](Widget const& w) -> std::optional<PropertyValue> { return PropertyValue{w.margin()}; }}},
        {"horizontal_alignment",
         {[](Widget& w, PropertyValue const& v) {
              return assign_with<HorizontalAlignment>(w, v, as_horizontal_alignment,
                                                      [](Widget& t, HorizontalAlignment a) { t.set_horizontal_alignment(a); });
          },
          [](Widget const& w) -> std::optional<PropertyValue> { return PropertyValue{w.horizontal_alignment()}; }}},
        {"vertical_alignment",
         {[](Widget& w, PropertyValue const& v) {
              return assign_with<VerticalAlignment>(w, v, as_vertical_alignment,
                                                    [](Widget& t, VerticalAlignment a) { t.set_vertical_alignment(a); });
          },
          [](Widget const& w) -> std::optional<PropertyValue> { return PropertyValue{w.vertical_alignment()}; }}},
        {"visibility",
         {[](Widget& w, PropertyValue const& v) {
              return assign_with<Visibility>(w, v, as_visibility, [](Widget& t, Visibility s) { t.set_visibility(s); });
          },
          [](Widget const& w) -> std::optional<PropertyValue> { return PropertyValue{w.visibility()}; }}},
        {"hit_test_visible",
         {[](Widget& w, PropertyValue const& v) {
              return assign_with<bool>(w, v, as_exact<bool>, [](Widget& t, bool b) { t.set_hit_test_visibility(b); });
          },
          [](Widget const& w) -> std::optional<PropertyValue> { return PropertyValue{w.is_hit_test_visible()}; }}},
        {"background",
         {[](Widget& w, PropertyValue const& v) {
              return assign_with<Color>(w, v, as_exact<Color>, [](Widget& t, Color c) { t.set_background(c); });
          },
          [](Widget const& w) -> std::optional<PropertyValue> { return PropertyValue{w.background()}; }}},
        {"foreground",
         {[](Widget& w, PropertyValue const& v) {
              return assign_with<Color>(w, v, as_exact<Color>, [](Widget& t, Color c) { t.set_foreground(c); });
          },
          [](Widget const& w) -> std::optional<PropertyValue> { return PropertyValue{w.foreground()}; }}},
    };
    return table;
}

} // namespace

auto horizontal_alignment_name(HorizontalAlignment value) -> std::string_view {
    switch (value) {
    case HorizontalAlignment::Stretch:
        return "Stretch";
    case HorizontalAlignment::Left:
        return "Left";
    case HorizontalAlignment::Center:
        return "Center";
    case HorizontalAlignment::Right:
        return "Right";
    }
    return "Stretch";
}

auto vertical_alignment_name(VerticalAlignment value) -> std::string_view {
    switch (value) {
    case VerticalAlignment::Stretch:
        return "Stretch";
    case VerticalAlignment::Top:
        return "Top";
    case VerticalAlignment::Center:
        return "Center";
    case VerticalAlignment::Bottom:
        return "Bottom";
    }
    return "Stretch";
}

auto visibility_name(Visibility value) -> std::string_view {
    switch (value) {
    case Visibility::Visible:
        return "Visible";
    case Visibility::Collapsed:
        return "Collapsed";
    case Visibility::Hidden:
        return "Hidden";
    }
    return "Visible";
}

auto Widget::set_width(float width) -> Widget& {
    width_ = width;
    invalidate_layout();
    return *this;
}

auto Widget::set_height(float height) -> Widget& {
    height_ = height;
    invalidate_layout();
    return *this;
}

auto Widget::set_min_size(Vec2 size) -> Widget& {
    min_size_ = size;
    invalidate_layout();
    return *this;
}

auto Widget::set_max_size(Vec2 size) -> Widget& {
    max_size_ = size;
    invalidate_layout();
    return *this;
}

auto Widget::set_margin(Thickness margin) -> Widget& {
    margin_ = margin;
    invalidate_layout();
    return *this;
}

auto Widget::set_horizontal_alignment(HorizontalAlignment alignment) -> Widget& {
    horizontal_alignment_ = alignment;
    invalidate_layout();
    return *this;
}

auto Widget::set_vertical_alignment(VerticalAlignment alignment) -> Widget& {
    vertical_alignment_ = alignment;
    invalidate_layout();
    return *this;
}

auto Widget::set_visibility(Visibility visibility) -> Widget& {
    visibility_ = visibility;
    invalidate_layout();
    return *this;
}

auto Widget::set_hit_test_visibility(bool visible) -> Widget& {
    is_hit_test_visible_ = visible;
    return *this;
}

auto Widget::set_background(Color color) -> Widget& {
    background_ = color;
    return *this;
}

auto Widget::set_foreground(Color color) -> Widget& {
    foreground_ = color;
    return *this;
}

auto Widget::set_property(std::string_view name, PropertyValue const& value) -> bool {
    auto const& table = property_table();
    auto const  found = table.find(name);
    if (found == table.end()) {
        return false;
    }
    return found->second.set(*this, value);
}

auto Widget::get_property(std::string_view name) const -> std::optional<PropertyValue> {
    auto const& table = property_table();
    auto const  found = table.find(name);
    if (found == table.end()) {
        return std::nullopt;
    }
    return found->second.get(*this);
}

auto WidgetBuilder::with_name(std::string name) -> WidgetBuilder& {
    widget_.name_ = std::move(name);
    return *this;
}

auto WidgetBuilder::with_width(float width) -> WidgetBuilder& {
    widget_.width_ = width;
    return *this;
}

auto WidgetBuilder::with_height(float height) -> WidgetBuilder& {
    widget_.height_ = height;
    return *this;
}

auto WidgetBuilder::with_min_size(Vec2 size) -> WidgetBuilder& {
    widget_.min_size_ = size;
    return *this;
}

auto WidgetBuilder::with_max_size(Vec2 size) -> WidgetBuilder& {
    widget_.max_size_ = size;
    return *this;
}

auto WidgetBuilder::with_margin(Thickness margin) -> WidgetBuilder& {
    widget_.margin_ = margin;
    return *this;
}

auto WidgetBuilder::with_horizontal_alignment(HorizontalAlignment alignment) -> WidgetBuilder& {
    widget_.horizontal_alignment_ = alignment;
    return *this;
}

auto WidgetBuilder::with_vertical_alignment(VerticalAlignment alignment) -> WidgetBuilder& {
    widget_.vertical_alignment_ = alignment;
    return *this;
}

auto WidgetBuilder::with_visibility(Visibility visibility) -> WidgetBuilder& {
    widget_.visibility_ = visibility;
    return *this;
}

auto WidgetBuilder::with_hit_test_visibility(bool visible) -> WidgetBuilder& {
    widget_.is_hit_test_visible_ = visible;
    return *this;
}

auto WidgetBuilder::with_background(Color color) -> WidgetBuilder& {
    widget_.background_ = color;
    return *this;
}

auto WidgetBuilder::with_foreground(Color color) -> WidgetBuilder& {
    widget_.foreground_ = color;
    return *this;
}

auto WidgetBuilder::with_child(NodeHandle child) -> WidgetBuilder& {
    widget_.children_.push_back(child);
    return *this;
}

auto WidgetBuilder::with_children(std::vector<NodeHandle> const& children) -> WidgetBuilder& {
    widget_.children_.insert(widget_.children_.end(), children.begin(), children.end());
    return *this;
}

auto WidgetBuilder::build() const -> Widget {
    return widget_;
}

} // namespace WS::UI
