#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace WS::Host {

/*
 * Small "--name value" / "--name=value" parser for host programs. Each option
 * owns a callback; parse() reports failures through the error sink and keeps
 * going so every bad argument is reported once.
 */
class HostCli {
public:
    // Returned by value callbacks; nullopt means the value was accepted.
    using ParseError = std::optional<std::string>;

    explicit HostCli(std::string_view program_name = "widgetspace");

    void set_error_sink(std::function<void(std::string const&)> sink);

    void add_flag(std::string_view name, std::function<void()> on_set);
    void add_value(std::string_view name, std::function<ParseError(std::string_view)> on_value);
    void add_int(std::string_view name, std::function<void(int)> on_value);
    void add_float(std::string_view name, std::function<void(float)> on_value);
    void add_alias(std::string_view alias, std::string_view target);

    [[nodiscard]] bool parse(int argc, char** argv);
    [[nodiscard]] bool had_errors() const { return had_error_; }
    [[nodiscard]] auto positional() const -> std::vector<std::string> const& { return positional_; }

private:
    struct Option {
        std::string                                    name;
        std::function<void()>                          on_flag;
        std::function<ParseError(std::string_view)>    on_value;
    };

    Option* find(std::string_view name);
    void    report(std::string_view message);

    std::vector<Option>                          options_;
    std::unordered_map<std::string, std::size_t> lookup_;
    std::vector<std::string>                     positional_;
    std::string                                  program_name_;
    std::function<void(std::string const&)>      error_sink_;
    bool                                         had_error_ = false;
};

} // namespace WS::Host
