#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace TS {

/**
 * Small option parser for the turnsync tools.
 *
 * Options are registered with a handler and matched by exact name ("--store") or
 * alias ("-s"). Values may be attached ("--turn=7") or given as the next token.
 * Errors are collected and reported through the error logger; parse() returns
 * false when any occurred.
 */
class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    CommandLine();

    void setProgramName(std::string_view name);
    void setErrorLogger(std::function<void(std::string const&)> logger);

    void addFlag(std::string_view name, std::function<void()> onSet);
    void addValue(std::string_view name, std::function<ParseError(std::string_view)> onValue);
    void addUnsigned(std::string_view name, std::function<void(std::uint64_t)> onValue);
    void addAlias(std::string_view alias, std::string_view target);

    [[nodiscard]] auto parse(int argc, char const* const* argv) -> bool;
    [[nodiscard]] auto hadErrors() const -> bool { return hadError_; }
    // Non-option tokens in the order they appeared.
    [[nodiscard]] auto positional() const -> std::vector<std::string> const& { return positional_; }

private:
    struct Option {
        std::string                                  name;
        bool                                         expectsValue = false;
        std::function<void()>                        onFlag;
        std::function<ParseError(std::string_view)> onValue;
    };

    auto find(std::string_view name) -> Option*;
    void registerOption(Option option);
    void logError(std::string_view message);

    std::vector<Option>                          options_;
    std::unordered_map<std::string, std::size_t> lookup_;
    std::vector<std::string>                     positional_;
    std::string                                  programName_;
    std::function<void(std::string const&)>      errorLogger_;
    bool                                         hadError_ = false;
};

} // namespace TS
