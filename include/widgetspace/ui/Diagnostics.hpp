#pragma once

#include <widgetspace/ui/UserInterface.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <string_view>

namespace WS::UI::Diagnostics {

inline auto handle_to_json(NodeHandle handle) -> nlohmann::json {
    if (handle.is_none()) {
        return nullptr;
    }
    return nlohmann::json{{"index", handle.index()}, {"generation", handle.generation()}};
}

inline auto vec2_to_json(Vec2 value) -> nlohmann::json {
    return nlohmann::json::array({value.x, value.y});
}

inline auto thickness_to_json(Thickness const& value) -> nlohmann::json {
    return nlohmann::json::array({value.left, value.top, value.right, value.bottom});
}

// Unset explicit sizes are written as null.
inline auto explicit_size_to_json(float value) -> nlohmann::json {
    if (std::isnan(value)) {
        return nullptr;
    }
    return value;
}

inline auto node_to_json(UserInterface const& ui, NodeHandle handle) -> nlohmann::json {
    auto const& widget = ui.node(handle).widget();
    auto const  range  = widget.command_range();

    auto children = nlohmann::json::array();
    for (auto const child : widget.children()) {
        children.push_back(node_to_json(ui, child));
    }

    return nlohmann::json{{"handle", handle_to_json(handle)},
                          {"name", widget.name()},
                          {"width", explicit_size_to_json(widget.width())},
                          {"height", explicit_size_to_json(widget.height())},
                          {"margin", thickness_to_json(widget.margin())},
                          {"horizontal_alignment", horizontal_alignment_name(widget.horizontal_alignment())},
                          {"vertical_alignment", vertical_alignment_name(widget.vertical_alignment())},
                          {"visibility", visibility_name(widget.visibility())},
                          {"global_visibility", widget.global_visibility()},
                          {"hit_test_visible", widget.is_hit_test_visible()},
                          {"desired_size", vec2_to_json(widget.desired_size())},
                          {"actual_size", vec2_to_json(widget.actual_size())},
                          {"local_position", vec2_to_json(widget.actual_local_position())},
                          {"screen_position", vec2_to_json(widget.screen_position())},
                          {"commands", nlohmann::json::array({range.begin, range.end})},
                          {"pending_events", widget.pending_event_count()},
                          {"children", std::move(children)}};
}

inline auto frame_summary_json(UserInterface const& ui) -> nlohmann::json {
    auto const& context = ui.drawing_context();
    return nlohmann::json{{"node_count", ui.node_count()},
                          {"command_count", context.commands().size()},
                          {"triangle_count", context.triangles().size()},
                          {"picked", handle_to_json(ui.picked_node())},
                          {"captured", handle_to_json(ui.captured_node())},
                          {"keyboard_focus", handle_to_json(ui.keyboard_focus_node())},
                          {"mouse_position", vec2_to_json(ui.mouse_position())},
                          {"pending_events", ui.pending_event_count()}};
}

} // namespace WS::UI::Diagnostics
