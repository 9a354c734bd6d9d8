#include "UiTestHelpers.hpp"

#include <doctest/doctest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace WS::UI;
using namespace WS::UI::Test;
namespace IO = WS::IO;

namespace {

auto boxed(float x, float y, float w, float h) -> WidgetBuilder {
    WidgetBuilder builder;
    builder.with_width(w)
            .with_height(h)
            .with_margin(Thickness{x, y, 0.0f, 0.0f})
            .with_horizontal_alignment(HorizontalAlignment::Left)
            .with_vertical_alignment(VerticalAlignment::Top);
    return builder;
}

struct Routed {
    std::string kind;
    NodeHandle  source;

    auto operator==(Routed const&) const -> bool = default;
};

auto routed(std::vector<UIEvent> const& events) -> std::vector<Routed> {
    std::vector<Routed> result;
    for (auto const& event : events) {
        result.push_back(Routed{std::string(event_kind_name(event.kind)), event.source});
    }
    return result;
}

} // namespace

TEST_SUITE("ui.eventrouter") {
    TEST_CASE("enter_move_leave_sequence") {
        UserInterface ui;
        auto const x = panel(ui, boxed(0.0f, 0.0f, 100.0f, 100.0f));
        auto const y = panel(ui, boxed(200.0f, 0.0f, 100.0f, 100.0f));
        run_frame(ui);

        CHECK_FALSE(ui.process_input_event(IO::CursorMoved{500.0f, 500.0f}));
        CHECK(ui.process_input_event(IO::CursorMoved{50.0f, 50.0f}));
        CHECK(ui.process_input_event(IO::CursorMoved{250.0f, 50.0f}));

        auto const expected = std::vector<Routed>{{"MouseEnter", x},
                                                  {"MouseMove", x},
                                                  {"MouseLeave", x},
                                                  {"MouseEnter", y},
                                                  {"MouseMove", y}};
        CHECK(routed(drain(ui)) == expected);
        CHECK_FALSE(ui.node(x).widget().is_mouse_over());
        CHECK(ui.node(y).widget().is_mouse_over());
        CHECK(ui.prev_picked_node() == y);
        CHECK(ui.mouse_position() == Vec2{250.0f, 50.0f});
    }

    TEST_CASE("moving_within_a_node_only_moves") {
        UserInterface ui;
        auto const x = panel(ui, boxed(0.0f, 0.0f, 100.0f, 100.0f));
        run_frame(ui);

        (void)ui.process_input_event(IO::CursorMoved{10.0f, 10.0f});
        (void)drain(ui);
        (void)ui.process_input_event(IO::CursorMoved{20.0f, 20.0f});
        CHECK(routed(drain(ui)) == std::vector<Routed>{{"MouseMove", x}});

        // Leaving to empty space fires a leave and nothing else.
        CHECK_FALSE(ui.process_input_event(IO::CursorMoved{500.0f, 500.0f}));
        CHECK(routed(drain(ui)) == std::vector<Routed>{{"MouseLeave", x}});
        CHECK(ui.picked_node().is_none());
    }

    TEST_CASE("key_without_focus_is_not_consumed") {
        UserInterface ui;
        (void)panel(ui, boxed(0.0f, 0.0f, 100.0f, 100.0f));
        run_frame(ui);

        CHECK_FALSE(ui.process_input_event(IO::KeyboardInput{true, IO::KeyCode::A, 0, IO::ButtonModifiers::None}));
        CHECK_FALSE(ui.process_input_event(IO::ReceivedCharacter{U'a'}));
        CHECK(ui.pending_event_count() == 0);
        CHECK_FALSE(ui.poll_ui_event().has_value());
    }

    TEST_CASE("press_focuses_and_keys_follow_focus") {
        UserInterface ui;
        auto const x = panel(ui, boxed(0.0f, 0.0f, 100.0f, 100.0f));
        run_frame(ui);

        (void)ui.process_input_event(IO::CursorMoved{10.0f, 10.0f});
        (void)drain(ui);

        CHECK(ui.process_input_event(IO::MouseButtonInput{IO::MouseButton::Left, true}));
        CHECK(ui.keyboard_focus_node() == x);
        CHECK(ui.process_input_event(IO::MouseButtonInput{IO::MouseButton::Left, false}));
        CHECK(ui.process_input_event(IO::KeyboardInput{true, IO::KeyCode::Enter, 28, IO::ButtonModifiers::Shift}));
        CHECK(ui.process_input_event(IO::KeyboardInput{false, IO::KeyCode::Enter, 28, IO::ButtonModifiers::None}));
        CHECK_FALSE(ui.process_input_event(IO::KeyboardInput{true, std::nullopt, 999, IO::ButtonModifiers::None}));
        CHECK(ui.process_input_event(IO::ReceivedCharacter{U'z'}));

        auto const events = drain(ui);
        CHECK(routed(events) == std::vector<Routed>{{"MouseDown", x}, {"MouseUp", x}, {"KeyDown", x}, {"KeyUp", x}, {"Text", x}});

        auto const* down = events[0].get_if<EventKinds::MouseDown>();
        REQUIRE(down != nullptr);
        CHECK(down->position == Vec2{10.0f, 10.0f});
        CHECK(down->button == IO::MouseButton::Left);
        auto const* key = events[2].get_if<EventKinds::KeyDown>();
        REQUIRE(key != nullptr);
        CHECK(key->code == IO::KeyCode::Enter);
        CHECK(IO::hasModifier(key->modifiers, IO::ButtonModifiers::Shift));
        CHECK(events[4].get_if<EventKinds::Text>()->symbol == U'z');
        for (auto const& event : events) {
            CHECK(event.target.is_none());
        }
    }

    TEST_CASE("press_on_empty_space_clears_focus") {
        UserInterface ui;
        auto const x = panel(ui, boxed(0.0f, 0.0f, 100.0f, 100.0f));
        run_frame(ui);
        ui.set_keyboard_focus(x);

        (void)ui.process_input_event(IO::CursorMoved{500.0f, 500.0f});
        CHECK_FALSE(ui.process_input_event(IO::MouseButtonInput{IO::MouseButton::Right, true}));
        CHECK(ui.keyboard_focus_node().is_none());
        CHECK_FALSE(ui.process_input_event(IO::MouseButtonInput{IO::MouseButton::Right, false}));
    }

    TEST_CASE("wheel_uses_line_deltas_only") {
        UserInterface ui;
        auto const x = panel(ui, boxed(0.0f, 0.0f, 100.0f, 100.0f));
        run_frame(ui);
        (void)ui.process_input_event(IO::CursorMoved{10.0f, 10.0f});
        (void)drain(ui);

        CHECK_FALSE(ui.process_input_event(IO::MouseWheel{IO::PixelDelta{0.0f, 12.0f}}));
        CHECK(ui.process_input_event(IO::MouseWheel{IO::LineDelta{0.0f, -2.0f}}));
        auto const events = drain(ui);
        REQUIRE(events.size() == 1);
        CHECK(events[0].source == x);
        CHECK(events[0].get_if<EventKinds::MouseWheel>()->amount == doctest::Approx(-2.0f));
    }

    TEST_CASE("window_events_are_ignored") {
        UserInterface ui;
        CHECK_FALSE(ui.process_input_event(IO::Resized{640, 480}));
        CHECK_FALSE(ui.process_input_event(IO::FocusChanged{true}));
        CHECK_FALSE(ui.process_input_event(IO::CloseRequested{}));
        CHECK(ui.pending_event_count() == 0);
    }

    TEST_CASE("poll_broadcasts_in_arena_order") {
        EventLog      log;
        UserInterface ui;
        auto const a = panel(ui, WidgetBuilder{}, NodeHandle{}, &log);
        auto const b = panel(ui, WidgetBuilder{}, a, &log);
        auto const c = panel(ui, WidgetBuilder{}, NodeHandle{}, &log);

        ui.send_event(UIEvent::targeted(b, EventKinds::Custom{"open", 42}));
        CHECK(ui.pending_event_count() == 1);

        auto const event = ui.poll_ui_event();
        REQUIRE(event.has_value());
        CHECK(event->target == b);
        CHECK(std::any_cast<int>(event->get_if<EventKinds::Custom>()->payload) == 42);

        REQUIRE(log.size() == 3);
        CHECK(log[0].self == a);
        CHECK(log[1].self == b);
        CHECK(log[2].self == c);
        for (auto const& entry : log) {
            CHECK(entry.kind == "open");
            CHECK(entry.target == b);
        }
        CHECK_FALSE(ui.poll_ui_event().has_value());
    }

    TEST_CASE("one_event_per_poll") {
        UserInterface ui;
        ui.send_event(UIEvent::targeted(NodeHandle{}, EventKinds::Custom{"first", {}}));
        ui.send_event(UIEvent::targeted(NodeHandle{}, EventKinds::Custom{"second", {}}));

        auto const first = ui.poll_ui_event();
        REQUIRE(first.has_value());
        CHECK(event_kind_name(first->kind) == "first");
        CHECK(ui.pending_event_count() == 1);
        auto const second = ui.poll_ui_event();
        REQUIRE(second.has_value());
        CHECK(event_kind_name(second->kind) == "second");
    }

    TEST_CASE("handled_flag_survives_dispatch") {
        UserInterface ui;
        auto const a = panel(ui, WidgetBuilder{});
        ui.node_as<TestPanel>(a).on_event = [](NodeHandle, UserInterface&, UIEvent& event) { event.handled = true; };

        ui.send_event(UIEvent::targeted(a, EventKinds::Custom{"ping", {}}));
        auto const event = ui.poll_ui_event();
        REQUIRE(event.has_value());
        CHECK(event->handled);
    }

    TEST_CASE("handler_cannot_borrow_itself") {
        UserInterface ui;
        auto const a = panel(ui, WidgetBuilder{}.with_name("a"));
        auto const b = panel(ui, WidgetBuilder{}.with_name("b"));
        auto       observed = 0;
        ui.node_as<TestPanel>(a).on_event = [&, b](NodeHandle self, UserInterface& inner, UIEvent&) {
            CHECK_THROWS_AS((void)inner.node(self), WS::ContractViolation);
            CHECK_FALSE(inner.is_valid(self));
            // Other nodes stay reachable and mutable.
            inner.node(b).widget().set_name("b-touched");
            ++observed;
        };

        ui.send_event(UIEvent::targeted(a, EventKinds::Custom{"ping", {}}));
        REQUIRE(ui.poll_ui_event().has_value());
        CHECK(observed == 1);
        CHECK(ui.is_valid(a));
        CHECK(ui.node(a).widget().name() == "a");
        CHECK(ui.node(b).widget().name() == "b-touched");
    }

    TEST_CASE("node_is_restored_when_handler_throws") {
        UserInterface ui;
        auto const a = panel(ui, WidgetBuilder{}.with_name("thrower"));
        ui.node_as<TestPanel>(a).on_event = [](NodeHandle, UserInterface&, UIEvent&) {
            throw std::runtime_error("handler failure");
        };

        ui.send_event(UIEvent::targeted(a, EventKinds::Custom{"ping", {}}));
        CHECK_THROWS_AS((void)ui.poll_ui_event(), std::runtime_error);
        CHECK(ui.is_valid(a));
        CHECK(ui.node(a).widget().name() == "thrower");
        CHECK(ui.node_count() == 2);
    }

    TEST_CASE("node_queues_are_drained_with_source") {
        UserInterface ui;
        auto const a = panel(ui, WidgetBuilder{});
        ui.node(a).widget().post_event(UIEvent{.kind = EventKinds::Custom{"clicked", {}}});
        CHECK(ui.node(a).widget().pending_event_count() == 1);

        auto const event = ui.poll_ui_event();
        REQUIRE(event.has_value());
        CHECK(event->source == a);
        CHECK(event_kind_name(event->kind) == "clicked");
        CHECK(ui.node(a).widget().pending_event_count() == 0);
    }

    TEST_CASE("events_posted_during_dispatch_are_queued_for_later") {
        UserInterface ui;
        auto const a = panel(ui, WidgetBuilder{});
        ui.node_as<TestPanel>(a).on_event = [](NodeHandle self, UserInterface& inner, UIEvent& event) {
            if (event_kind_name(event.kind) == "ping") {
                inner.send_event(UIEvent::targeted(self, EventKinds::Custom{"pong", {}}));
            }
        };

        ui.send_event(UIEvent::targeted(a, EventKinds::Custom{"ping", {}}));
        auto const events = drain(ui);
        REQUIRE(events.size() == 2);
        CHECK(event_kind_name(events[1].kind) == "pong");
    }

    TEST_CASE("removed_and_spawned_nodes_during_dispatch") {
        EventLog      log;
        UserInterface ui;
        auto const first  = panel(ui, WidgetBuilder{}, NodeHandle{}, &log);
        auto const victim = panel(ui, WidgetBuilder{}, NodeHandle{}, &log);
        NodeHandle spawned{};
        ui.node_as<TestPanel>(first).on_event = [&](NodeHandle, UserInterface& inner, UIEvent&) {
            inner.remove_node(victim);
            spawned = panel(inner, WidgetBuilder{}, NodeHandle{}, &log);
        };

        ui.send_event(UIEvent::targeted(NodeHandle{}, EventKinds::Custom{"go", {}}));
        REQUIRE(ui.poll_ui_event().has_value());

        REQUIRE(log.size() == 1);
        CHECK(log[0].self == first);
        CHECK_FALSE(ui.is_valid(victim));
        CHECK(ui.is_valid(spawned));
    }

    TEST_CASE("handler_removing_own_child_leaves_tree_intact") {
        UserInterface ui;
        auto const list = panel(ui, WidgetBuilder{}.with_name("list"));
        auto const item = panel(ui, WidgetBuilder{}.with_name("item"), list);
        std::optional<WS::Error::Code> failure;
        ui.node_as<TestPanel>(list).on_event = [&failure, item](NodeHandle, UserInterface& inner, UIEvent&) {
            try {
                inner.remove_node(item);
            } catch (WS::ContractViolation const& violation) {
                failure = violation.code;
                throw;
            }
        };

        ui.send_event(UIEvent::targeted(list, EventKinds::Custom{"delete", {}}));
        CHECK_THROWS_AS((void)ui.poll_ui_event(), WS::ContractViolation);
        CHECK(failure == WS::Error::Code::SlotVacant);

        CHECK(ui.is_valid(list));
        CHECK(ui.is_valid(item));
        CHECK(ui.node(item).widget().parent() == list);
        CHECK(ui.node(list).widget().children() == std::vector<NodeHandle>{item});
        CHECK_NOTHROW(run_frame(ui));
    }

    TEST_CASE("handler_reparenting_own_child_leaves_tree_intact") {
        UserInterface ui;
        auto const list  = panel(ui, WidgetBuilder{}.with_name("list"));
        auto const item  = panel(ui, WidgetBuilder{}.with_name("item"), list);
        auto const other = panel(ui, WidgetBuilder{}.with_name("other"));
        ui.node_as<TestPanel>(list).on_event = [item, other](NodeHandle, UserInterface& inner, UIEvent&) {
            inner.link_nodes(item, other);
        };

        ui.send_event(UIEvent::targeted(list, EventKinds::Custom{"move", {}}));
        CHECK_THROWS_AS((void)ui.poll_ui_event(), WS::ContractViolation);

        CHECK(ui.node(item).widget().parent() == list);
        CHECK(ui.node(list).widget().children() == std::vector<NodeHandle>{item});
        CHECK(ui.node(other).widget().children().empty());
        CHECK_FALSE(ui.is_node_child_of(item, other));
        CHECK_NOTHROW(run_frame(ui));
    }

    TEST_CASE("handler_can_add_under_own_child") {
        UserInterface ui;
        auto const list = panel(ui, WidgetBuilder{}.with_name("list"));
        auto const item = panel(ui, WidgetBuilder{}.with_name("item"), list);
        NodeHandle added{};
        ui.node_as<TestPanel>(list).on_event = [&added, item](NodeHandle, UserInterface& inner, UIEvent&) {
            added = panel(inner, WidgetBuilder{}.with_name("detail"), item);
        };

        ui.send_event(UIEvent::targeted(list, EventKinds::Custom{"expand", {}}));
        REQUIRE(ui.poll_ui_event().has_value());
        REQUIRE(ui.is_valid(added));
        CHECK(ui.node(added).widget().parent() == item);
        CHECK(ui.node(item).widget().children() == std::vector<NodeHandle>{added});
        CHECK(ui.node_count() == 4);
    }

    TEST_CASE("capture_from_a_handler") {
        UserInterface ui;
        auto const a = panel(ui, boxed(0.0f, 0.0f, 50.0f, 50.0f));
        (void)panel(ui, boxed(100.0f, 0.0f, 50.0f, 50.0f));
        run_frame(ui);
        ui.node_as<TestPanel>(a).on_event = [](NodeHandle self, UserInterface& inner, UIEvent& event) {
            if (event.source == self && event.is<EventKinds::MouseDown>()) {
                (void)inner.capture_mouse(self);
            }
        };

        (void)ui.process_input_event(IO::CursorMoved{10.0f, 10.0f});
        (void)ui.process_input_event(IO::MouseButtonInput{IO::MouseButton::Left, true});
        (void)drain(ui);
        CHECK(ui.captured_node() == a);

        (void)ui.process_input_event(IO::CursorMoved{120.0f, 10.0f});
        CHECK(ui.picked_node() == a);
    }
}
