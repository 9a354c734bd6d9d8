#pragma once

#include <widgetspace/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace WS::UI {

struct UserInterfaceConfig {
    // Outline the picked node on top of every frame.
    bool        visual_debug = false;
    // Clip rects are the node bounds grown by this much on every side.
    float       clip_margin  = 0.9f;
    std::string root_name    = "root";
};

// Unknown keys are ignored; missing keys keep their defaults.
[[nodiscard]] auto load_config(nlohmann::json const& document) -> Expected<UserInterfaceConfig>;
[[nodiscard]] auto parse_config(std::string_view text) -> Expected<UserInterfaceConfig>;

} // namespace WS::UI
