#include "HostCli.hpp"

#include <charconv>
#include <iostream>
#include <sstream>

namespace WS::Host {

HostCli::HostCli(std::string_view program_name)
    : program_name_(program_name) {}

void HostCli::set_error_sink(std::function<void(std::string const&)> sink) {
    error_sink_ = std::move(sink);
}

void HostCli::add_flag(std::string_view name, std::function<void()> on_set) {
    options_.push_back(Option{std::string(name), std::move(on_set), {}});
    lookup_.insert_or_assign(std::string(name), options_.size() - 1);
}

void HostCli::add_value(std::string_view name, std::function<ParseError(std::string_view)> on_value) {
    options_.push_back(Option{std::string(name), {}, std::move(on_value)});
    lookup_.insert_or_assign(std::string(name), options_.size() - 1);
}

void HostCli::add_int(std::string_view name, std::function<void(int)> on_value) {
    this->add_value(name, [stored = std::string(name), handler = std::move(on_value)](std::string_view token) -> ParseError {
        int value = 0;
        auto const* end = token.data() + token.size();
        auto const result = std::from_chars(token.data(), end, value);
        if (token.empty() || result.ec != std::errc{} || result.ptr != end) {
            return stored + " expects an integer, got '" + std::string(token) + "'";
        }
        handler(value);
        return std::nullopt;
    });
}

void HostCli::add_float(std::string_view name, std::function<void(float)> on_value) {
    this->add_value(name, [stored = std::string(name), handler = std::move(on_value)](std::string_view token) -> ParseError {
        std::istringstream stream{std::string(token)};
        float value = 0.0f;
        stream >> value;
        if (token.empty() || stream.fail() || !stream.eof()) {
            return stored + " expects a number, got '" + std::string(token) + "'";
        }
        handler(value);
        return std::nullopt;
    });
}

void HostCli::add_alias(std::string_view alias, std::string_view target) {
    auto it = lookup_.find(std::string(target));
    if (it == lookup_.end()) {
        this->report("alias '" + std::string(alias) + "' names unknown option '" + std::string(target) + "'");
        had_error_ = true;
        return;
    }
    lookup_.insert_or_assign(std::string(alias), it->second);
}

bool HostCli::parse(int argc, char** argv) {
    had_error_ = false;
    positional_.clear();

    for (int i = 1; i < argc; ++i) {
        std::string_view token{argv[i]};
        if (token.size() < 2 || token.front() != '-') {
            positional_.emplace_back(token);
            continue;
        }

        std::optional<std::string_view> attached;
        auto name = token;
        if (auto const equals = token.find('='); equals != std::string_view::npos) {
            name     = token.substr(0, equals);
            attached = token.substr(equals + 1);
        }

        auto* option = this->find(name);
        if (option == nullptr) {
            this->report("unknown argument '" + std::string(token) + "'");
            had_error_ = true;
            continue;
        }

        if (option->on_flag) {
            if (attached) {
                this->report(option->name + " does not take a value");
                had_error_ = true;
                continue;
            }
            option->on_flag();
            continue;
        }

        auto value = attached;
        if (!value) {
            if (i + 1 >= argc) {
                this->report(option->name + " requires a value");
                had_error_ = true;
                continue;
            }
            value = std::string_view{argv[++i]};
        }
        if (auto error = option->on_value(*value)) {
            this->report(*error);
            had_error_ = true;
        }
    }
    return !had_error_;
}

HostCli::Option* HostCli::find(std::string_view name) {
    auto it = lookup_.find(std::string(name));
    if (it == lookup_.end()) {
        return nullptr;
    }
    return &options_[it->second];
}

void HostCli::report(std::string_view message) {
    std::string text = program_name_;
    text.append(": ");
    text.append(message);
    if (error_sink_) {
        error_sink_(text);
    } else {
        std::cerr << text << '\n';
    }
}

} // namespace WS::Host
