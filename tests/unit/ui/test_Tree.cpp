#include "UiTestHelpers.hpp"

#include <doctest/doctest.h>

using namespace WS;
using namespace WS::UI;
using namespace WS::UI::Test;

TEST_SUITE("ui.tree") {
    TEST_CASE("root_canvas_exists") {
        UserInterface ui{UserInterfaceConfig{.root_name = "window"}};
        CHECK(ui.node_count() == 1);
        CHECK(ui.is_valid(ui.root()));
        CHECK(ui.node(ui.root()).widget().name() == "window");
        CHECK(ui.try_node_as<Canvas>(ui.root()) != nullptr);
        CHECK(ui.node(ui.root()).widget().parent().is_none());
    }

    TEST_CASE("add_node_links_under_root_or_parent") {
        UserInterface ui;
        auto const a = panel(ui, WidgetBuilder{}.with_name("a"));
        auto const b = panel(ui, WidgetBuilder{}.with_name("b"), a);

        CHECK(ui.node(a).widget().parent() == ui.root());
        CHECK(ui.node(b).widget().parent() == a);
        CHECK(ui.is_node_direct_child_of(a, ui.root()));
        CHECK(ui.is_node_direct_child_of(b, a));
        CHECK_FALSE(ui.is_node_direct_child_of(b, ui.root()));
        CHECK(ui.is_node_child_of(b, ui.root()));
        CHECK_FALSE(ui.is_node_child_of(a, b));
    }

    TEST_CASE("builder_children_are_relinked") {
        UserInterface ui;
        auto const first  = panel(ui, WidgetBuilder{}.with_name("first"));
        auto const second = panel(ui, WidgetBuilder{}.with_name("second"));
        auto const holder = panel(ui, WidgetBuilder{}.with_name("holder").with_children({first, second}));

        CHECK(ui.node(holder).widget().children() == std::vector<NodeHandle>{first, second});
        CHECK(ui.node(first).widget().parent() == holder);
        CHECK(ui.node(ui.root()).widget().children() == std::vector<NodeHandle>{holder});
    }

    TEST_CASE("link_and_unlink_keep_both_sides_consistent") {
        UserInterface ui;
        auto const a = panel(ui, WidgetBuilder{});
        auto const b = panel(ui, WidgetBuilder{});

        ui.link_nodes(b, a);
        CHECK(ui.node(b).widget().parent() == a);
        CHECK(ui.node(ui.root()).widget().children() == std::vector<NodeHandle>{a});

        ui.unlink_node(b);
        CHECK(ui.node(b).widget().parent().is_none());
        CHECK(ui.node(a).widget().children().empty());
    }

    TEST_CASE("linking_into_own_subtree_is_rejected") {
        UserInterface ui;
        auto const a = panel(ui, WidgetBuilder{});
        auto const b = panel(ui, WidgetBuilder{}, a);

        CHECK_THROWS_AS(ui.link_nodes(a, a), ContractViolation);
        CHECK_THROWS_AS(ui.link_nodes(a, b), ContractViolation);
        CHECK(ui.node(b).widget().parent() == a);
        CHECK(ui.node(a).widget().parent() == ui.root());
    }

    TEST_CASE("remove_node_frees_the_subtree") {
        UserInterface ui;
        auto const a = panel(ui, WidgetBuilder{});
        auto const b = panel(ui, WidgetBuilder{}, a);
        auto const c = panel(ui, WidgetBuilder{}, b);
        auto const keep = panel(ui, WidgetBuilder{});
        ui.set_keyboard_focus(c);

        ui.remove_node(a);
        CHECK_FALSE(ui.is_valid(a));
        CHECK_FALSE(ui.is_valid(b));
        CHECK_FALSE(ui.is_valid(c));
        CHECK(ui.is_valid(keep));
        CHECK(ui.node_count() == 2);
        CHECK(ui.keyboard_focus_node().is_none());
        CHECK(ui.node(ui.root()).widget().children() == std::vector<NodeHandle>{keep});
        CHECK_THROWS_AS((void)ui.node(b), ContractViolation);

        // Freed slots come back with a new generation.
        auto const reused = panel(ui, WidgetBuilder{});
        CHECK_FALSE(ui.is_valid(a));
        CHECK(ui.is_valid(reused));
    }

    TEST_CASE("removing_root_or_stale_handles_is_a_contract_violation") {
        UserInterface ui;
        auto const a = panel(ui, WidgetBuilder{});
        ui.remove_node(a);

        CHECK_THROWS_AS(ui.remove_node(ui.root()), ContractViolation);
        CHECK_THROWS_AS(ui.remove_node(a), ContractViolation);
        CHECK_THROWS_AS(ui.add_node(std::make_unique<TestPanel>(Widget{}), a), ContractViolation);
        CHECK(ui.node_count() == 1);
    }

    TEST_CASE("bad_builder_children_leave_tree_untouched") {
        UserInterface ui;
        auto const gone = panel(ui, WidgetBuilder{});
        ui.remove_node(gone);
        auto const outer = panel(ui, WidgetBuilder{}.with_name("outer"));
        auto const inner = panel(ui, WidgetBuilder{}.with_name("inner"), outer);

        CHECK_THROWS_AS((void)panel(ui, WidgetBuilder{}.with_child(gone)), ContractViolation);
        CHECK_THROWS_AS((void)panel(ui, WidgetBuilder{}.with_child(ui.root())), ContractViolation);
        CHECK_THROWS_AS((void)panel(ui, WidgetBuilder{}.with_child(outer), outer), ContractViolation);
        CHECK_THROWS_AS((void)panel(ui, WidgetBuilder{}.with_child(outer), inner), ContractViolation);

        CHECK(ui.node_count() == 3);
        CHECK(ui.node(ui.root()).widget().children() == std::vector<NodeHandle>{outer});
        CHECK(ui.node(outer).widget().children() == std::vector<NodeHandle>{inner});
        CHECK(ui.node(inner).widget().children().empty());
    }

    TEST_CASE("find_by_name_down_and_up") {
        UserInterface ui;
        auto const menu  = panel(ui, WidgetBuilder{}.with_name("menu"));
        auto const item  = panel(ui, WidgetBuilder{}.with_name("item"), menu);
        auto const label = panel(ui, WidgetBuilder{}.with_name("label"), item);

        CHECK(ui.find_by_name_down(ui.root(), "label") == label);
        CHECK(ui.find_by_name_down(menu, "item") == item);
        CHECK(ui.find_by_name_down(item, "menu").is_none());
        CHECK(ui.find_by_name_up(label, "menu") == menu);
        CHECK(ui.find_by_name_up(label, "label") == label);
        CHECK(ui.find_by_name_up(menu, "label").is_none());
        CHECK(ui.find_by_name_down(NodeHandle{}, "menu").is_none());

        auto const tall = ui.find_by_criteria_down(ui.root(), [](Control const& control) {
            return control.widget().name().size() == 5;
        });
        CHECK(tall == label);
    }

    TEST_CASE("borrow_by_name_fails_fast_on_miss") {
        UserInterface ui;
        auto const menu = panel(ui, WidgetBuilder{}.with_name("menu"));
        auto const item = panel(ui, WidgetBuilder{}.with_name("item"), menu);

        CHECK(&ui.borrow_by_name_down(ui.root(), "item") == &ui.node(item));
        CHECK(&ui.borrow_by_name_up(item, "menu") == &ui.node(menu));
        CHECK_THROWS_AS((void)ui.borrow_by_name_down(ui.root(), "absent"), ContractViolation);
        CHECK_THROWS_AS((void)ui.borrow_by_name_up(item, "absent"), ContractViolation);
    }

    TEST_CASE("typed_access") {
        UserInterface ui;
        auto const a = panel(ui, WidgetBuilder{});

        CHECK(ui.try_node_as<TestPanel>(a) != nullptr);
        CHECK(ui.try_node_as<Canvas>(a) == nullptr);
        CHECK_THROWS_AS((void)ui.node_as<Canvas>(a), ContractViolation);
        ui.node_as<TestPanel>(a).elapsed = 3.0f;
        CHECK(ui.node_as<TestPanel>(a).elapsed == doctest::Approx(3.0f));
    }

    TEST_CASE("set_keyboard_focus_validates") {
        UserInterface ui;
        auto const a = panel(ui, WidgetBuilder{});
        ui.set_keyboard_focus(a);
        CHECK(ui.keyboard_focus_node() == a);
        ui.set_keyboard_focus(NodeHandle{});
        CHECK(ui.keyboard_focus_node().is_none());
        ui.remove_node(a);
        CHECK_THROWS_AS(ui.set_keyboard_focus(a), ContractViolation);
    }
}
