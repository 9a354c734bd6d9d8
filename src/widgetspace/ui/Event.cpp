#include <widgetspace/ui/Event.hpp>

namespace WS::UI {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

auto event_kind_name(UIEventKind const& kind) -> std::string_view {
    return std::visit(overloaded{
                              [](EventKinds::MouseDown const&) -> std::string_view { return "MouseDown"; },
                              [](EventKinds::MouseUp const&) -> std::string_view { return "MouseUp"; },
                              [](EventKinds::MouseMove const&) -> std::string_view { return "MouseMove"; },
                              [](EventKinds::MouseEnter const&) -> std::string_view { return "MouseEnter"; },
                              [](EventKinds::MouseLeave const&) -> std::string_view { return "MouseLeave"; },
                              [](EventKinds::MouseWheel const&) -> std::string_view { return "MouseWheel"; },
                              [](EventKinds::KeyDown const&) -> std::string_view { return "KeyDown"; },
                              [](EventKinds::KeyUp const&) -> std::string_view { return "KeyUp"; },
                              [](EventKinds::Text const&) -> std::string_view { return "Text"; },
                              // Custom kinds are named by their sender.
                              [](EventKinds::Custom const& custom) -> std::string_view { return custom.name; },
                      },
                      kind);
}

} // namespace WS::UI
