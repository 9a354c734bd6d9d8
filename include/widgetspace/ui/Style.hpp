#pragma once

#include <widgetspace/core/Error.hpp>

#include <nlohmann/json.hpp>
#include <parallel_hashmap/phmap.h>

#include <any>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace WS::UI {

using PropertyValue = std::any;

struct Setter {
    std::string   name;
    PropertyValue value;
};

/*
 * Ordered list of property setters with an optional base style. Applying a style
 * walks the base chain first, so setters of the derived style win.
 */
class Style {
public:
    Style() = default;
    explicit Style(std::shared_ptr<Style const> base)
        : base_(std::move(base)) {}

    auto set(std::string name, PropertyValue value) -> Style& {
        setters_.push_back(Setter{std::move(name), std::move(value)});
        return *this;
    }

    auto set_base_style(std::shared_ptr<Style const> base) -> void {
        base_ = std::move(base);
    }

    [[nodiscard]] auto base_style() const -> std::shared_ptr<Style const> const& {
        return base_;
    }

    [[nodiscard]] auto setters() const -> std::vector<Setter> const& {
        return setters_;
    }

private:
    std::shared_ptr<Style const> base_{};
    std::vector<Setter>          setters_{};
};

class StyleSheet {
public:
    auto add(std::string name, std::shared_ptr<Style const> style) -> void;

    [[nodiscard]] auto find(std::string_view name) const -> std::shared_ptr<Style const>;
    [[nodiscard]] auto size() const -> std::size_t { return styles_.size(); }
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] static auto from_json(nlohmann::json const& document) -> Expected<StyleSheet>;
    [[nodiscard]] static auto parse(std::string_view text) -> Expected<StyleSheet>;

private:
    phmap::flat_hash_map<std::string, std::shared_ptr<Style const>> styles_{};
};

// Converts one JSON setter value into the property value a widget accepts.
[[nodiscard]] auto property_from_json(nlohmann::json const& value) -> Expected<PropertyValue>;

} // namespace WS::UI
