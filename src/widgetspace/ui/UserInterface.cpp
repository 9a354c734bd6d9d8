#include <widgetspace/ui/UserInterface.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace WS::UI {

UserInterface::UserInterface(UserInterfaceConfig config)
    : config_(std::move(config)) {
    auto root = WidgetBuilder{}.with_name(config_.root_name).build();
    root_canvas_ = this->add_node(std::make_unique<Canvas>(std::move(root)));
}

auto UserInterface::add_node(UINode node, NodeHandle parent) -> NodeHandle {
    if (!node) {
        throw ContractViolation(Error::Code::InvalidHandle, "add_node called with an empty node");
    }

    auto const link_to = parent.is_some() ? parent : root_canvas_;
    if (link_to.is_some()) {
        (void)this->node(link_to);
    }

    // Every link below must succeed once the node is spawned.
    auto& widget = node->widget();
    for (auto const child : widget.children_) {
        (void)this->node(child);
        if (link_to.is_some() && (child == link_to || this->is_node_child_of(link_to, child))) {
            throw ContractViolation(Error::Code::CyclicReference,
                                    "child " + child.to_string() + " is an ancestor of the new node");
        }
        this->require_parent_link(child);
    }

    auto pending_children = std::move(widget.children_);
    widget.children_.clear();
    widget.parent_ = NodeHandle{};

    auto const handle = nodes_.spawn(std::move(node));

    // A fresh node closes no cycle, so the ancestor walk of link_nodes is skipped.
    if (link_to.is_some()) {
        this->attach(handle, link_to);
    }
    for (auto const child : pending_children) {
        this->unlink_node(child);
        this->attach(child, handle);
    }

    ws_log("Added node " + handle.to_string() + " '" + this->node(handle).widget().name() + "'", "UserInterface");
    return handle;
}

auto UserInterface::link_nodes(NodeHandle child, NodeHandle parent) -> void {
    if (child == parent) {
        throw ContractViolation(Error::Code::CyclicReference, "cannot link node " + child.to_string() + " to itself");
    }
    // Validate both ends before touching either side.
    (void)this->node(child);
    (void)this->node(parent);
    if (this->is_node_child_of(parent, child)) {
        throw ContractViolation(Error::Code::CyclicReference,
                                "node " + parent.to_string() + " is a descendant of " + child.to_string());
    }
    this->require_parent_link(child);

    this->unlink_node(child);
    this->attach(child, parent);
}

auto UserInterface::attach(NodeHandle child, NodeHandle parent) -> void {
    this->node(child).widget().parent_ = parent;
    auto& parent_widget = this->node(parent).widget();
    parent_widget.children_.push_back(child);
    parent_widget.invalidate_layout();
}

auto UserInterface::require_parent_link(NodeHandle handle) const -> void {
    auto const parent_handle = this->node(handle).widget().parent();
    if (parent_handle.is_some()) {
        // Throws while the parent is taken out for dispatch, so its child list cannot drift.
        (void)this->node(parent_handle);
    }
}

auto UserInterface::unlink_node(NodeHandle handle) -> void {
    this->require_parent_link(handle);

    auto& widget             = this->node(handle).widget();
    auto const parent_handle = widget.parent_;
    if (parent_handle.is_none()) {
        return;
    }
    widget.parent_ = NodeHandle{};

    auto& parent_widget = this->node(parent_handle).widget();
    auto& siblings      = parent_widget.children_;
    if (auto it = std::find(siblings.begin(), siblings.end(), handle); it != siblings.end()) {
        siblings.erase(it);
    }
    parent_widget.invalidate_layout();
}

auto UserInterface::collect_subtree(NodeHandle handle, std::vector<NodeHandle>& out) const -> void {
    auto const& widget = this->node(handle).widget();
    out.push_back(handle);
    for (auto const child : widget.children()) {
        this->collect_subtree(child, out);
    }
}

auto UserInterface::forget_handle(NodeHandle handle) -> void {
    for (auto* tracked : {&picked_node_, &prev_picked_node_, &captured_node_, &keyboard_focus_node_}) {
        if (*tracked == handle) {
            *tracked = NodeHandle{};
        }
    }
}

auto UserInterface::remove_node(NodeHandle handle) -> void {
    if (handle == root_canvas_) {
        throw ContractViolation(Error::Code::NotSupported, "the root canvas cannot be removed");
    }

    // Resolve the whole subtree first so a bad handle leaves the tree untouched.
    std::vector<NodeHandle> subtree;
    this->collect_subtree(handle, subtree);
    this->require_parent_link(handle);

    this->unlink_node(handle);
    // Deepest nodes last in pre-order; free in reverse.
    for (auto it = subtree.rbegin(); it != subtree.rend(); ++it) {
        this->forget_handle(*it);
        (void)nodes_.free(*it);
    }
    ws_log("Removed node " + handle.to_string() + " with " + std::to_string(subtree.size() - 1) + " descendants",
           "UserInterface");
}

auto UserInterface::node(NodeHandle handle) -> Control& {
    return *nodes_.borrow(handle);
}

auto UserInterface::node(NodeHandle handle) const -> Control const& {
    return *nodes_.borrow(handle);
}

auto UserInterface::find_by_name_down(NodeHandle start, std::string_view name) const -> NodeHandle {
    return this->find_by_criteria_down(start, [name](Control const& control) { return control.widget().name() == name; });
}

auto UserInterface::find_by_name_up(NodeHandle start, std::string_view name) const -> NodeHandle {
    return this->find_by_criteria_up(start, [name](Control const& control) { return control.widget().name() == name; });
}

auto UserInterface::borrow_by_name_down(NodeHandle start, std::string_view name) -> Control& {
    return this->node(this->find_by_name_down(start, name));
}

auto UserInterface::borrow_by_name_down(NodeHandle start, std::string_view name) const -> Control const& {
    return this->node(this->find_by_name_down(start, name));
}

auto UserInterface::borrow_by_name_up(NodeHandle start, std::string_view name) -> Control& {
    return this->node(this->find_by_name_up(start, name));
}

auto UserInterface::borrow_by_name_up(NodeHandle start, std::string_view name) const -> Control const& {
    return this->node(this->find_by_name_up(start, name));
}

auto UserInterface::is_node_child_of(NodeHandle handle, NodeHandle ancestor) const -> bool {
    if (handle.is_none() || ancestor.is_none()) {
        return false;
    }
    auto current = this->node(handle).widget().parent();
    while (current.is_some()) {
        if (current == ancestor) {
            return true;
        }
        current = this->node(current).widget().parent();
    }
    return false;
}

auto UserInterface::is_node_direct_child_of(NodeHandle handle, NodeHandle parent) const -> bool {
    auto const& children = this->node(parent).widget().children();
    return std::find(children.begin(), children.end(), handle) != children.end();
}

auto UserInterface::capture_mouse(NodeHandle handle) -> bool {
    // A node may capture from its own handler, while its slot is taken out.
    if (captured_node_.is_some() || !nodes_.is_current_handle(handle)) {
        return false;
    }
    captured_node_ = handle;
    ws_log("Mouse captured by " + handle.to_string(), "UserInterface");
    return true;
}

auto UserInterface::release_mouse_capture() -> void {
    captured_node_ = NodeHandle{};
}

auto UserInterface::set_keyboard_focus(NodeHandle handle) -> void {
    if (handle.is_some() && !nodes_.is_valid_handle(handle)) {
        throw ContractViolation(Error::Code::InvalidHandle, "focus target " + handle.to_string() + " does not resolve");
    }
    keyboard_focus_node_ = handle;
    ws_log("Keyboard focus moved to " + handle.to_string(), "UserInterface");
}

auto UserInterface::update_node(NodeHandle handle) -> void {
    auto& widget = this->node(handle).widget();

    auto screen_position   = widget.actual_local_position_;
    auto parent_visibility = true;
    if (widget.parent_.is_some()) {
        auto const& parent_widget = this->node(widget.parent_).widget();
        screen_position += parent_widget.screen_position_;
        parent_visibility = parent_widget.global_visibility_;
    }

    widget.screen_position_   = screen_position;
    widget.global_visibility_ = widget.visibility_ == Visibility::Visible && parent_visibility;

    for (auto const child : widget.children_) {
        this->update_node(child);
    }
}

auto UserInterface::update(Vec2 screen_size, float dt) -> void {
    auto& root = this->node(root_canvas_);
    root.measure(*this, screen_size);
    root.arrange(*this, Rect{0.0f, 0.0f, screen_size.x, screen_size.y});
    this->update_node(root_canvas_);
    nodes_.for_each([dt](NodeHandle, UINode& node) { node->update(dt); });
}

auto UserInterface::draw_node(NodeHandle handle, std::uint8_t nesting) -> void {
    auto& control = this->node(handle);
    auto& widget  = control.widget();
    if (!widget.global_visibility_) {
        return;
    }

    auto const start = drawing_context_.commands().size();
    drawing_context_.set_nesting(nesting);
    drawing_context_.commit_clip_rect(widget.screen_bounds().inflate(config_.clip_margin, config_.clip_margin));

    control.draw(drawing_context_);

    widget.command_range_ = CommandRange{start, drawing_context_.commands().size()};

    for (auto const child : widget.children_) {
        this->draw_node(child, static_cast<std::uint8_t>(nesting + 1));
    }

    drawing_context_.revert_clip_geom();
}

auto UserInterface::draw() -> DrawingContext const& {
    drawing_context_.clear();
    nodes_.for_each([](NodeHandle, UINode& node) { node->widget().command_range_ = CommandRange{}; });

    this->draw_node(root_canvas_, 1);

    if (config_.visual_debug && nodes_.is_valid_handle(picked_node_)) {
        drawing_context_.set_nesting(0);
        drawing_context_.push_rect(this->node(picked_node_).widget().screen_bounds(), 1.0f, Colors::White);
        (void)drawing_context_.commit(CommandKind::Geometry);
    }
    return drawing_context_;
}

auto UserInterface::is_node_clipped(NodeHandle handle, Vec2 point) const -> bool {
    auto const& widget = this->node(handle).widget();
    if (!widget.global_visibility()) {
        return true;
    }

    auto const& commands = drawing_context_.commands();
    auto const  range    = widget.command_range();
    auto        clipped  = true;
    for (auto i = range.begin; i < range.end && i < commands.size(); ++i) {
        auto const& command = commands[i];
        if (command.kind == CommandKind::Clip && drawing_context_.is_command_contains_point(command, point)) {
            clipped = false;
            break;
        }
    }

    // Clip regions intersect up the ancestor chain.
    if (!clipped && widget.parent().is_some()) {
        clipped = this->is_node_clipped(widget.parent(), point);
    }
    return clipped;
}

auto UserInterface::is_node_contains_point(NodeHandle handle, Vec2 point) const -> bool {
    auto const& widget = this->node(handle).widget();
    if (!widget.global_visibility() || this->is_node_clipped(handle, point)) {
        return false;
    }

    auto const& commands = drawing_context_.commands();
    auto const  range    = widget.command_range();
    for (auto i = range.begin; i < range.end && i < commands.size(); ++i) {
        auto const& command = commands[i];
        if (command.kind == CommandKind::Geometry && drawing_context_.is_command_contains_point(command, point)) {
            return true;
        }
    }
    return false;
}

auto UserInterface::pick_node(NodeHandle handle, Vec2 point, int& level) const -> NodeHandle {
    auto const& widget = this->node(handle).widget();
    if (!widget.is_hit_test_visible()) {
        return NodeHandle{};
    }

    NodeHandle picked{};
    auto       topmost_level = 0;
    if (this->is_node_contains_point(handle, point)) {
        picked        = handle;
        topmost_level = level;
    }

    for (auto const child : widget.children()) {
        ++level;
        auto const picked_child = this->pick_node(child, point, level);
        if (picked_child.is_some() && level > topmost_level) {
            topmost_level = level;
            picked        = picked_child;
        }
    }
    return picked;
}

auto UserInterface::hit_test(Vec2 point) const -> NodeHandle {
    if (nodes_.is_valid_handle(captured_node_)) {
        return captured_node_;
    }
    auto level = 0;
    return this->pick_node(root_canvas_, point, level);
}

} // namespace WS::UI
