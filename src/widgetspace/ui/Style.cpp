#include <widgetspace/ui/Style.hpp>
#include <widgetspace/ui/Geometry.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
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

[[nodiscard]] auto hex_digit(char ch) -> std::optional<std::uint8_t> {
    if (ch >= '0' && ch <= '9') {
        return static_cast<std::uint8_t>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f') {
        return static_cast<std::uint8_t>(ch - 'a' + 10);
    }
    if (ch >= 'A' && ch <= 'F') {
        return static_cast<std::uint8_t>(ch - 'A' + 10);
    }
    return std::nullopt;
}

// "#RRGGBB" or "#RRGGBBAA".
[[nodiscard]] auto parse_hex_color(std::string_view text) -> std::optional<Color> {
    if (text.size() != 7 && text.size() != 9) {
        return std::nullopt;
    }
    std::uint8_t channels[4] = {0, 0, 0, 255};
    auto const   count       = (text.size() - 1) / 2;
    for (std::size_t i = 0; i < count; ++i) {
        auto const hi = hex_digit(text[1 + i * 2]);
        auto const lo = hex_digit(text[2 + i * 2]);
        if (!hi || !lo) {
            return std::nullopt;
        }
        channels[i] = static_cast<std::uint8_t>(*hi * 16 + *lo);
    }
    return Color{channels[0], channels[1], channels[2], channels[3]};
}

[[nodiscard]] auto all_numbers(Json const& array) -> bool {
    return std::all_of(array.begin(), array.end(), [](Json const& item) { return item.is_number(); });
}

struct PendingStyle {
    std::optional<std::string>    base;
    std::vector<Setter>           setters;
    std::shared_ptr<Style const>  resolved;
    bool                          visiting = false;
};

using PendingMap = phmap::flat_hash_map<std::string, PendingStyle>;

auto resolve_style(PendingMap& pending, std::string const& name) -> Expected<std::shared_ptr<Style const>> {
    auto it = pending.find(name);
    if (it == pending.end()) {
        return std::unexpected(make_error(Error::Code::NotFound, name, "unknown base style"));
    }
    auto& entry = it->second;
    if (entry.resolved) {
        return entry.resolved;
    }
    if (entry.visiting) {
        return std::unexpected(make_error(Error::Code::CyclicReference, name, "base style chain loops back"));
    }

    entry.visiting = true;
    std::shared_ptr<Style const> base;
    if (entry.base) {
        // Copy: the recursive call may rehash the map.
        auto const base_name = *entry.base;
        auto       resolved  = resolve_style(pending, base_name);
        if (!resolved) {
            return std::unexpected(resolved.error());
        }
        base = std::move(*resolved);
    }

    auto& current = pending.at(name);
    auto  style   = std::make_shared<Style>(std::move(base));
    for (auto& setter : current.setters) {
        style->set(std::move(setter.name), std::move(setter.value));
    }
    current.setters.clear();
    current.visiting = false;
    current.resolved = std::move(style);
    return current.resolved;
}

} // namespace

auto property_from_json(nlohmann::json const& value) -> Expected<PropertyValue> {
    if (value.is_boolean()) {
        return PropertyValue{value.get<bool>()};
    }
    if (value.is_number()) {
        return PropertyValue{value.get<float>()};
    }
    if (value.is_string()) {
        auto const text = value.get<std::string>();
        if (!text.empty() && text.front() == '#') {
            if (auto color = parse_hex_color(text)) {
                return PropertyValue{*color};
            }
            return std::unexpected(make_error(Error::Code::MalformedInput, text, "expected #RRGGBB or #RRGGBBAA"));
        }
        return PropertyValue{text};
    }
    if (value.is_array() && all_numbers(value)) {
        if (value.size() == 2) {
            return PropertyValue{Vec2{value[0].get<float>(), value[1].get<float>()}};
        }
        if (value.size() == 4) {
            return PropertyValue{Thickness{value[0].get<float>(), value[1].get<float>(),
                                           value[2].get<float>(), value[3].get<float>()}};
        }
    }
    return std::unexpected(make_error(Error::Code::InvalidType, "setter", "unsupported value " + value.dump()));
}

auto StyleSheet::add(std::string name, std::shared_ptr<Style const> style) -> void {
    styles_.insert_or_assign(std::move(name), std::move(style));
}

auto StyleSheet::find(std::string_view name) const -> std::shared_ptr<Style const> {
    auto it = styles_.find(std::string{name});
    if (it == styles_.end()) {
        return nullptr;
    }
    return it->second;
}

auto StyleSheet::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(styles_.size());
    for (auto const& [name, style] : styles_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

auto StyleSheet::from_json(nlohmann::json const& document) -> Expected<StyleSheet> {
    if (!document.is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "document", "must be an object"));
    }
    auto styles_it = document.find("styles");
    if (styles_it == document.end() || !styles_it->is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "styles", "object is required"));
    }

    PendingMap pending;
    for (auto const& [name, entry] : styles_it->items()) {
        if (!entry.is_object()) {
            return std::unexpected(make_error(Error::Code::MalformedInput, name, "style must be an object"));
        }
        PendingStyle style;
        if (auto base_it = entry.find("base"); base_it != entry.end()) {
            if (!base_it->is_string()) {
                return std::unexpected(make_error(Error::Code::MalformedInput, name + ".base", "must be a string"));
            }
            style.base = base_it->get<std::string>();
        }
        if (auto setters_it = entry.find("setters"); setters_it != entry.end()) {
            if (!setters_it->is_object()) {
                return std::unexpected(make_error(Error::Code::MalformedInput, name + ".setters", "must be an object"));
            }
            for (auto const& [property, raw] : setters_it->items()) {
                auto value = property_from_json(raw);
                if (!value) {
                    auto error = value.error();
                    error.message = name + "." + property + ": " + error.message.value_or("");
                    return std::unexpected(std::move(error));
                }
                style.setters.push_back(Setter{property, std::move(*value)});
            }
        }
        pending.emplace(name, std::move(style));
    }

    std::vector<std::string> names;
    names.reserve(pending.size());
    for (auto const& [name, entry] : pending) {
        names.push_back(name);
    }

    StyleSheet sheet;
    for (auto const& name : names) {
        auto resolved = resolve_style(pending, name);
        if (!resolved) {
            return std::unexpected(resolved.error());
        }
        sheet.add(name, std::move(*resolved));
    }
    ws_log("Loaded style sheet with " + std::to_string(sheet.size()) + " styles", "Style");
    return sheet;
}

auto StyleSheet::parse(std::string_view text) -> Expected<StyleSheet> {
    auto document = Json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, "document", "invalid JSON"));
    }
    return from_json(document);
}

} // namespace WS::UI
