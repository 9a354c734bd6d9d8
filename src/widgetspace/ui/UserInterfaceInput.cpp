#include <widgetspace/ui/UserInterface.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>
#include <vector>

namespace WS::UI {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

auto UserInterface::send_event(UIEvent event) -> void {
    events_.push_back(std::move(event));
}

auto UserInterface::poll_ui_event() -> std::optional<UIEvent> {
    nodes_.for_each([this](NodeHandle handle, UINode& node) {
        auto& outgoing = node->widget().events_;
        while (auto posted = outgoing.pop_front()) {
            posted->source = handle;
            events_.push_back(std::move(*posted));
        }
    });

    auto event = events_.pop_front();
    if (!event) {
        return std::nullopt;
    }

    // Nodes spawned by a handler during this dispatch do not see the event.
    std::vector<NodeHandle> recipients;
    recipients.reserve(nodes_.alive_count());
    nodes_.for_each([&recipients](NodeHandle handle, UINode const&) { recipients.push_back(handle); });

    ws_log("Dispatching " + std::string(event_kind_name(event->kind)) + " from " + event->source.to_string() + " to "
               + std::to_string(recipients.size()) + " nodes",
           "EventRouter");

    for (auto const handle : recipients) {
        // Removed by an earlier handler.
        if (!nodes_.is_valid_handle(handle)) {
            continue;
        }
        auto taken = nodes_.take_at(handle.index());
        if (!taken) {
            continue;
        }

        struct SlotRestoreGuard {
            Pool<UINode>* pool  = nullptr;
            std::size_t   index = 0;
            UINode*       node  = nullptr;
            ~SlotRestoreGuard() {
                if (pool && node) {
                    pool->put_back(index, std::move(*node));
                }
            }
        } restore{&nodes_, handle.index(), &*taken};

        (*taken)->handle_event(handle, *this, *event);
    }

    return event;
}

auto UserInterface::on_mouse_button(IO::MouseButtonInput const& input) -> bool {
    if (input.pressed) {
        picked_node_         = this->hit_test(mouse_position_);
        keyboard_focus_node_ = picked_node_;
        if (picked_node_.is_some()) {
            events_.push_back(UIEvent::from(picked_node_, EventKinds::MouseDown{mouse_position_, input.button}));
            return true;
        }
        return false;
    }

    if (picked_node_.is_some()) {
        events_.push_back(UIEvent::from(picked_node_, EventKinds::MouseUp{mouse_position_, input.button}));
        return true;
    }
    return false;
}

auto UserInterface::on_cursor_moved(IO::CursorMoved const& input) -> bool {
    mouse_position_ = Vec2{input.x, input.y};
    picked_node_    = this->hit_test(mouse_position_);

    if (picked_node_ != prev_picked_node_ && nodes_.is_valid_handle(prev_picked_node_)) {
        auto& previous = this->node(prev_picked_node_).widget();
        if (previous.is_mouse_over_) {
            previous.is_mouse_over_ = false;
            events_.push_back(UIEvent::from(prev_picked_node_, EventKinds::MouseLeave{}));
        }
    }

    if (picked_node_.is_none()) {
        return false;
    }

    auto& picked = this->node(picked_node_).widget();
    if (!picked.is_mouse_over_) {
        picked.is_mouse_over_ = true;
        events_.push_back(UIEvent::from(picked_node_, EventKinds::MouseEnter{}));
    }
    events_.push_back(UIEvent::from(picked_node_, EventKinds::MouseMove{mouse_position_}));
    return true;
}

auto UserInterface::on_mouse_wheel(IO::MouseWheel const& input) -> bool {
    // Only line deltas scroll; pixel deltas from touchpads are left to the host.
    auto const* lines = std::get_if<IO::LineDelta>(&input.delta);
    if (lines == nullptr || picked_node_.is_none()) {
        return false;
    }
    events_.push_back(UIEvent::from(picked_node_, EventKinds::MouseWheel{mouse_position_, lines->y}));
    return true;
}

auto UserInterface::on_keyboard(IO::KeyboardInput const& input) -> bool {
    if (keyboard_focus_node_.is_none() || !input.key) {
        return false;
    }
    if (input.pressed) {
        events_.push_back(UIEvent::from(keyboard_focus_node_, EventKinds::KeyDown{*input.key, input.modifiers}));
    } else {
        events_.push_back(UIEvent::from(keyboard_focus_node_, EventKinds::KeyUp{*input.key, input.modifiers}));
    }
    return true;
}

auto UserInterface::on_character(IO::ReceivedCharacter const& input) -> bool {
    if (keyboard_focus_node_.is_none()) {
        return false;
    }
    events_.push_back(UIEvent::from(keyboard_focus_node_, EventKinds::Text{input.codepoint}));
    return true;
}

auto UserInterface::process_input_event(IO::InputEvent const& event) -> bool {
    auto const processed = std::visit(overloaded{
                                              [this](IO::MouseButtonInput const& input) { return this->on_mouse_button(input); },
                                              [this](IO::CursorMoved const& input) { return this->on_cursor_moved(input); },
                                              [this](IO::MouseWheel const& input) { return this->on_mouse_wheel(input); },
                                              [this](IO::KeyboardInput const& input) { return this->on_keyboard(input); },
                                              [this](IO::ReceivedCharacter const& input) { return this->on_character(input); },
                                              [](IO::Resized const&) { return false; },
                                              [](IO::FocusChanged const&) { return false; },
                                              [](IO::CloseRequested const&) { return false; },
                                      },
                                      event);

    prev_picked_node_ = picked_node_;
    return processed;
}

} // namespace WS::UI
