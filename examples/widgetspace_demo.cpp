#include <widgetspace/core/Error.hpp>
#include <widgetspace/io/InputEvents.hpp>
#include <widgetspace/ui/Config.hpp>
#include <widgetspace/ui/Control.hpp>
#include <widgetspace/ui/Diagnostics.hpp>
#include <widgetspace/ui/Style.hpp>
#include <widgetspace/ui/UserInterface.hpp>

#include "host/HostCli.hpp"
#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr std::string_view kAppName = "widgetspace_demo";

using namespace WS::UI;

// Solid rectangle that turns a press on itself into a "clicked" event.
class DemoPanel : public Control {
public:
    explicit DemoPanel(Widget widget)
        : widget_(std::move(widget)) {}

    auto widget() -> Widget& override { return widget_; }
    auto widget() const -> Widget const& override { return widget_; }

    auto draw(DrawingContext& context) -> void override {
        context.push_rect_filled(widget_.screen_bounds(), widget_.background());
        (void)context.commit(CommandKind::Geometry);
    }

    auto handle_event(NodeHandle self, UserInterface&, UIEvent& event) -> void override {
        if (event.source != self) {
            return;
        }
        if (event.is<EventKinds::MouseDown>()) {
            widget_.post_event(UIEvent::from(self, EventKinds::Custom{"clicked", widget_.name()}));
            event.handled = true;
        }
    }

private:
    Widget widget_;
};

struct DemoOptions {
    int                        frames       = 4;
    float                      width        = 800.0f;
    float                      height       = 600.0f;
    bool                       dump_json    = false;
    bool                       visual_debug = false;
    std::optional<std::string> config_path;
    std::optional<std::string> styles_path;
};

auto fail(std::string_view message, std::optional<WS::Error> error = std::nullopt) -> int {
    std::cerr << kAppName << ": " << message;
    if (error) {
        std::cerr << ": " << WS::describeError(*error);
    }
    std::cerr << "\n";
    return 1;
}

auto read_file(std::string const& path) -> std::optional<std::string> {
    std::ifstream stream(path);
    if (!stream) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

auto describe(UserInterface const& ui, UIEvent const& event) -> std::string {
    std::string text{event_kind_name(event.kind)};
    text.append(" source=");
    text.append(ui.is_valid(event.source) ? ui.node(event.source).widget().name() : event.source.to_string());
    if (event.handled) {
        text.append(" handled");
    }
    return text;
}

// Pointer path crossing both panels, one step per frame, with a click on the second.
auto scripted_input(int frame, DemoOptions const& options) -> std::vector<WS::IO::InputEvent> {
    auto const w = options.width;
    auto const h = options.height;
    switch (frame % 4) {
    case 0:
        return {WS::IO::CursorMoved{w * 0.05f, h * 0.05f}};
    case 1:
        return {WS::IO::CursorMoved{w * 0.25f, h * 0.5f}};
    case 2:
        return {WS::IO::CursorMoved{w * 0.75f, h * 0.5f},
                WS::IO::MouseButtonInput{WS::IO::MouseButton::Left, true},
                WS::IO::MouseButtonInput{WS::IO::MouseButton::Left, false}};
    default:
        return {WS::IO::KeyboardInput{true, WS::IO::KeyCode::Enter, 0, WS::IO::ButtonModifiers::None},
                WS::IO::ReceivedCharacter{U'x'}};
    }
}

} // namespace

int main(int argc, char** argv) {
    DemoOptions options;

    WS::Host::HostCli cli{kAppName};
    cli.add_int("--frames", [&](int value) { options.frames = value; });
    cli.add_float("--width", [&](float value) { options.width = value; });
    cli.add_float("--height", [&](float value) { options.height = value; });
    cli.add_value("--config", [&](std::string_view value) -> WS::Host::HostCli::ParseError {
        options.config_path = std::string(value);
        return std::nullopt;
    });
    cli.add_value("--styles", [&](std::string_view value) -> WS::Host::HostCli::ParseError {
        options.styles_path = std::string(value);
        return std::nullopt;
    });
    cli.add_flag("--dump-json", [&] { options.dump_json = true; });
    cli.add_flag("--visual-debug", [&] { options.visual_debug = true; });
    cli.add_alias("-n", "--frames");
    if (!cli.parse(argc, argv)) {
        return 2;
    }

#ifdef WS_LOG_DEBUG
    if (auto const* env = std::getenv("WIDGETSPACE_LOG"); env && std::string_view{env} != "0") {
        WS::set_thread_name("Demo");
        WS::set_logging_enabled(true);
    }
#endif

    UserInterfaceConfig config;
    if (options.config_path) {
        auto text = read_file(*options.config_path);
        if (!text) {
            return fail("cannot read config file " + *options.config_path);
        }
        auto parsed = parse_config(*text);
        if (!parsed) {
            return fail("invalid config", parsed.error());
        }
        config = std::move(*parsed);
    }
    if (options.visual_debug) {
        config.visual_debug = true;
    }

    UserInterface ui{config};

    auto const left = ui.add_node(DemoPanel{WidgetBuilder{}
                                                    .with_name("left")
                                                    .with_width(options.width * 0.4f)
                                                    .with_horizontal_alignment(HorizontalAlignment::Left)
                                                    .with_margin(Thickness::uniform(10.0f))
                                                    .with_background(Color::opaque(200, 60, 60))
                                                    .build()});
    auto const right = ui.add_node(DemoPanel{WidgetBuilder{}
                                                     .with_name("right")
                                                     .with_width(options.width * 0.4f)
                                                     .with_horizontal_alignment(HorizontalAlignment::Right)
                                                     .with_margin(Thickness::uniform(10.0f))
                                                     .with_background(Color::opaque(60, 60, 200))
                                                     .build()});

    if (options.styles_path) {
        auto text = read_file(*options.styles_path);
        if (!text) {
            return fail("cannot read style sheet " + *options.styles_path);
        }
        auto sheet = StyleSheet::parse(*text);
        if (!sheet) {
            return fail("invalid style sheet", sheet.error());
        }
        for (auto const handle : {left, right}) {
            auto& control = ui.node(handle);
            if (auto style = sheet->find(control.widget().name())) {
                control.apply_style(style);
            }
        }
    }

    auto const screen = Vec2{options.width, options.height};
    for (int frame = 0; frame < options.frames; ++frame) {
        ui.update(screen, 1.0f / 60.0f);
        auto const& context = ui.draw();
        std::cout << "frame " << frame << ": " << context.commands().size() << " commands\n";

        for (auto const& input : scripted_input(frame, options)) {
            (void)ui.process_input_event(input);
        }
        while (auto event = ui.poll_ui_event()) {
            std::cout << "  " << describe(ui, *event) << "\n";
        }
    }

    if (options.dump_json) {
        std::cout << Diagnostics::node_to_json(ui, ui.root()).dump(2) << "\n";
        std::cout << Diagnostics::frame_summary_json(ui).dump(2) << "\n";
    }
    return 0;
}
