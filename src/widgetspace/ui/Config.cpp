#include <widgetspace/ui/Config.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>

namespace WS::UI {
namespace {

using Json = nlohmann::json;

[[nodiscard]] auto make_error(Error::Code code, std::string_view field, std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    message.append(": ");
    message.append(detail);
    return Error{code, std::move(message)};
}

} // namespace

auto load_config(nlohmann::json const& document) -> Expected<UserInterfaceConfig> {
    if (!document.is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "config", "must be an object"));
    }

    UserInterfaceConfig config;

    if (auto it = document.find("visual_debug"); it != document.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(make_error(Error::Code::InvalidType, "visual_debug", "must be a bool"));
        }
        config.visual_debug = it->get<bool>();
    }

    if (auto it = document.find("clip_margin"); it != document.end()) {
        if (!it->is_number()) {
            return std::unexpected(make_error(Error::Code::InvalidType, "clip_margin", "must be a number"));
        }
        auto const margin = it->get<float>();
        if (!(margin >= 0.0f)) {
            return std::unexpected(make_error(Error::Code::MalformedInput, "clip_margin", "must be non-negative"));
        }
        config.clip_margin = margin;
    }

    if (auto it = document.find("root_name"); it != document.end()) {
        if (!it->is_string()) {
            return std::unexpected(make_error(Error::Code::InvalidType, "root_name", "must be a string"));
        }
        config.root_name = it->get<std::string>();
    }

    ws_log("Loaded config clip_margin=" + std::to_string(config.clip_margin)
               + " visual_debug=" + (config.visual_debug ? "true" : "false"),
           "Config");
    return config;
}

auto parse_config(std::string_view text) -> Expected<UserInterfaceConfig> {
    auto document = Json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "config", "invalid JSON"));
    }
    return load_config(document);
}

} // namespace WS::UI
