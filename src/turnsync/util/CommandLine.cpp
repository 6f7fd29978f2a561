#include "util/CommandLine.hpp"

#include <charconv>
#include <iostream>

namespace TS {

CommandLine::CommandLine() : programName_("turnsync") {}

void CommandLine::setProgramName(std::string_view name) {
    programName_.assign(name.begin(), name.end());
}

void CommandLine::setErrorLogger(std::function<void(std::string const&)> logger) {
    errorLogger_ = std::move(logger);
}

void CommandLine::addFlag(std::string_view name, std::function<void()> onSet) {
    Option option;
    option.name.assign(name.begin(), name.end());
    option.onFlag = std::move(onSet);
    registerOption(std::move(option));
}

void CommandLine::addValue(std::string_view name, std::function<ParseError(std::string_view)> onValue) {
    Option option;
    option.name.assign(name.begin(), name.end());
    option.expectsValue = true;
    option.onValue      = std::move(onValue);
    registerOption(std::move(option));
}

void CommandLine::addUnsigned(std::string_view name, std::function<void(std::uint64_t)> onValue) {
    addValue(name, [stored = std::string(name), handler = std::move(onValue)](std::string_view token) -> ParseError {
        std::uint64_t value = 0;
        auto const*   end   = token.data() + token.size();
        auto [ptr, ec]      = std::from_chars(token.data(), end, value);
        if (token.empty() || ec != std::errc{} || ptr != end) {
            return stored + " expects a non-negative integer";
        }
        handler(value);
        return std::nullopt;
    });
}

void CommandLine::addAlias(std::string_view alias, std::string_view target) {
    auto it = lookup_.find(std::string(target));
    if (it == lookup_.end()) {
        logError("missing option for alias '" + std::string(target) + "'");
        hadError_ = true;
        return;
    }
    lookup_.emplace(std::string(alias), it->second);
}

auto CommandLine::parse(int argc, char const* const* argv) -> bool {
    hadError_ = false;
    positional_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string_view                token{argv[i]};
        std::string_view                name = token;
        std::optional<std::string_view> attached;
        if (auto equals = token.find('='); equals != std::string_view::npos && token.starts_with("-")) {
            name     = token.substr(0, equals);
            attached = token.substr(equals + 1);
        }

        auto* option = find(name);
        if (option == nullptr) {
            if (token.size() > 1 && token.front() == '-') {
                logError("unknown option '" + std::string(token) + "'");
                hadError_ = true;
            } else {
                positional_.emplace_back(token);
            }
            continue;
        }

        if (!option->expectsValue) {
            if (attached) {
                logError(option->name + " does not accept a value");
                hadError_ = true;
            } else if (option->onFlag) {
                option->onFlag();
            }
            continue;
        }

        auto value = attached;
        if (!value) {
            if (i + 1 >= argc) {
                logError(option->name + " requires a value");
                hadError_ = true;
                continue;
            }
            value = std::string_view{argv[++i]};
        }
        if (auto error = option->onValue(*value)) {
            logError(*error);
            hadError_ = true;
        }
    }
    return !hadError_;
}

auto CommandLine::find(std::string_view name) -> Option* {
    auto it = lookup_.find(std::string(name));
    return it == lookup_.end() ? nullptr : &options_[it->second];
}

void CommandLine::registerOption(Option option) {
    options_.push_back(std::move(option));
    lookup_.emplace(options_.back().name, options_.size() - 1);
}

void CommandLine::logError(std::string_view message) {
    std::string text = programName_ + ": ";
    text.append(message.begin(), message.end());
    if (errorLogger_) {
        errorLogger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

} // namespace TS
