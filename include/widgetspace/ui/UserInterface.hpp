#pragma once

#include <widgetspace/core/Error.hpp>
#include <widgetspace/core/Pool.hpp>
#include <widgetspace/io/InputEvents.hpp>
#include <widgetspace/ui/Config.hpp>
#include <widgetspace/ui/Control.hpp>
#include <widgetspace/ui/DrawingContext.hpp>
#include <widgetspace/ui/Event.hpp>
#include <widgetspace/utils/PopFrontQueue.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include <utility>

namespace WS::UI {

/*
 * Owns the node arena and everything the per-frame pipeline needs: the root
 * canvas, the drawing context, the shared event queue and the pick, capture and
 * focus handles. Single-threaded; a host calls, once per frame,
 *
 *   update(screen_size, dt) -> draw() -> poll_ui_event()... -> process_input_event()...
 *
 * Handles that do not resolve make node()/node_as() throw ContractViolation.
 * Searches return the none handle on a miss.
 */
class UserInterface {
public:
    explicit UserInterface(UserInterfaceConfig config = {});

    UserInterface(UserInterface const&)            = delete;
    UserInterface& operator=(UserInterface const&) = delete;

    // Links under parent, or under the root when parent is none. Children recorded
    // on the widget by WidgetBuilder are relinked under the new node.
    auto add_node(UINode node, NodeHandle parent = NodeHandle{}) -> NodeHandle;

    template <typename T>
        requires std::derived_from<std::remove_cvref_t<T>, Control>
    auto add_node(T&& node, NodeHandle parent = NodeHandle{}) -> NodeHandle {
        return this->add_node(std::make_unique<std::remove_cvref_t<T>>(std::forward<T>(node)), parent);
    }

    auto link_nodes(NodeHandle child, NodeHandle parent) -> void;
    auto unlink_node(NodeHandle node) -> void;
    // Frees the node and its whole subtree.
    auto remove_node(NodeHandle node) -> void;

    [[nodiscard]] auto node(NodeHandle handle) -> Control&;
    [[nodiscard]] auto node(NodeHandle handle) const -> Control const&;

    template <typename T>
    [[nodiscard]] auto node_as(NodeHandle handle) -> T& {
        if (auto* typed = this->try_node_as<T>(handle)) {
            return *typed;
        }
        throw ContractViolation(Error::Code::TypeMismatch, "node " + handle.to_string() + " has a different type");
    }

    template <typename T>
    [[nodiscard]] auto try_node_as(NodeHandle handle) -> T* {
        return dynamic_cast<T*>(&this->node(handle));
    }

    template <typename T>
    [[nodiscard]] auto try_node_as(NodeHandle handle) const -> T const* {
        return dynamic_cast<T const*>(&this->node(handle));
    }

    [[nodiscard]] auto is_valid(NodeHandle handle) const -> bool { return nodes_.is_valid_handle(handle); }
    [[nodiscard]] auto node_count() const -> std::size_t { return nodes_.alive_count(); }
    [[nodiscard]] auto root() const -> NodeHandle { return root_canvas_; }

    template <typename F>
    [[nodiscard]] auto find_by_criteria_down(NodeHandle start, F const& criteria) const -> NodeHandle {
        if (start.is_none()) {
            return NodeHandle{};
        }
        auto const& control = this->node(start);
        if (criteria(control)) {
            return start;
        }
        for (auto const child : control.widget().children()) {
            if (auto const found = this->find_by_criteria_down(child, criteria); found.is_some()) {
                return found;
            }
        }
        return NodeHandle{};
    }

    template <typename F>
    [[nodiscard]] auto find_by_criteria_up(NodeHandle start, F const& criteria) const -> NodeHandle {
        auto current = start;
        while (current.is_some()) {
            auto const& control = this->node(current);
            if (criteria(control)) {
                return current;
            }
            current = control.widget().parent();
        }
        return NodeHandle{};
    }

    [[nodiscard]] auto find_by_name_down(NodeHandle start, std::string_view name) const -> NodeHandle;
    [[nodiscard]] auto find_by_name_up(NodeHandle start, std::string_view name) const -> NodeHandle;
    // Like find_by_name_*, but a miss throws.
    [[nodiscard]] auto borrow_by_name_down(NodeHandle start, std::string_view name) -> Control&;
    [[nodiscard]] auto borrow_by_name_down(NodeHandle start, std::string_view name) const -> Control const&;
    [[nodiscard]] auto borrow_by_name_up(NodeHandle start, std::string_view name) -> Control&;
    [[nodiscard]] auto borrow_by_name_up(NodeHandle start, std::string_view name) const -> Control const&;

    // Any depth below ancestor.
    [[nodiscard]] auto is_node_child_of(NodeHandle node, NodeHandle ancestor) const -> bool;
    [[nodiscard]] auto is_node_direct_child_of(NodeHandle node, NodeHandle parent) const -> bool;

    // First capture wins until released. None and stale handles are refused.
    auto capture_mouse(NodeHandle node) -> bool;
    auto release_mouse_capture() -> void;
    auto set_keyboard_focus(NodeHandle node) -> void;

    [[nodiscard]] auto picked_node() const -> NodeHandle { return picked_node_; }
    [[nodiscard]] auto prev_picked_node() const -> NodeHandle { return prev_picked_node_; }
    [[nodiscard]] auto captured_node() const -> NodeHandle { return captured_node_; }
    [[nodiscard]] auto keyboard_focus_node() const -> NodeHandle { return keyboard_focus_node_; }
    [[nodiscard]] auto mouse_position() const -> Vec2 { return mouse_position_; }

    [[nodiscard]] auto config() const -> UserInterfaceConfig const& { return config_; }
    auto set_visual_debug(bool enabled) -> void { config_.visual_debug = enabled; }

    // measure -> arrange -> propagation -> per-node update(dt).
    auto update(Vec2 screen_size, float dt) -> void;
    auto draw() -> DrawingContext const&;
    [[nodiscard]] auto drawing_context() const -> DrawingContext const& { return drawing_context_; }

    [[nodiscard]] auto is_node_clipped(NodeHandle node, Vec2 point) const -> bool;
    [[nodiscard]] auto is_node_contains_point(NodeHandle node, Vec2 point) const -> bool;
    [[nodiscard]] auto hit_test(Vec2 point) const -> NodeHandle;

    auto send_event(UIEvent event) -> void;
    [[nodiscard]] auto pending_event_count() const -> std::size_t { return events_.size(); }

    /*
     * Collects the nodes' outgoing queues, then pops one event and hands it to
     * every node that was alive when dispatch began, in arena order. Each node is
     * moved out of its slot while its handler runs.
     */
    auto poll_ui_event() -> std::optional<UIEvent>;

    // Returns true when the raw event produced at least one UI event.
    auto process_input_event(IO::InputEvent const& event) -> bool;

private:
    auto update_node(NodeHandle handle) -> void;
    auto draw_node(NodeHandle handle, std::uint8_t nesting) -> void;
    [[nodiscard]] auto pick_node(NodeHandle handle, Vec2 point, int& level) const -> NodeHandle;
    auto collect_subtree(NodeHandle handle, std::vector<NodeHandle>& out) const -> void;
    auto require_parent_link(NodeHandle handle) const -> void;
    // Parent/child bookkeeping only; callers validate.
    auto attach(NodeHandle child, NodeHandle parent) -> void;
    auto forget_handle(NodeHandle handle) -> void;

    auto on_mouse_button(IO::MouseButtonInput const& input) -> bool;
    auto on_cursor_moved(IO::CursorMoved const& input) -> bool;
    auto on_mouse_wheel(IO::MouseWheel const& input) -> bool;
    auto on_keyboard(IO::KeyboardInput const& input) -> bool;
    auto on_character(IO::ReceivedCharacter const& input) -> bool;

    Pool<UINode>           nodes_{};
    DrawingContext         drawing_context_{};
    UserInterfaceConfig    config_{};
    NodeHandle             root_canvas_{};
    NodeHandle             picked_node_{};
    NodeHandle             prev_picked_node_{};
    NodeHandle             captured_node_{};
    NodeHandle             keyboard_focus_node_{};
    Vec2                   mouse_position_{};
    PopFrontQueue<UIEvent> events_{};
};

} // namespace WS::UI
