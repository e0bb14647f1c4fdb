#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace RP::Tools::CLI {

/**
 * Argument parser for the bundled tools.
 *
 * Options are written "--name value" or "--name=value". A token that does not
 * start with '-' (a lone "-" included) goes to the positional handler; an
 * unregistered option goes to the unknown-argument handler, which by default
 * reports it and fails the parse. Every problem is reported through the error
 * logger as "<program>: <message>" and parsing continues with the next token.
 */
class ToolCli {
public:
    using ParseError = std::optional<std::string>;

    struct FlagOption {
        std::function<void()> on_set;
    };

    struct ValueOption {
        std::function<ParseError(std::optional<std::string_view>)> on_value;
        bool value_optional           = false;
        bool allow_leading_dash_value = false;
    };

    struct IntOption {
        std::function<void(int)> on_value;
    };

    ToolCli();

    auto set_program_name(std::string_view name) -> void;
    auto set_positional_handler(std::function<ParseError(std::string_view)> handler) -> void;
    auto set_unknown_argument_handler(std::function<bool(std::string_view)> handler) -> void;
    auto set_error_logger(std::function<void(std::string const&)> logger) -> void;

    auto add_flag(std::string_view name, FlagOption option) -> void;
    auto add_value(std::string_view name, ValueOption option) -> void;
    auto add_int(std::string_view name, IntOption option) -> void;
    auto add_alias(std::string_view alias, std::string_view target) -> void;

    [[nodiscard]] auto parse(int argc, char** argv) -> bool;
    [[nodiscard]] auto had_errors() const -> bool;

private:
    struct Registered {
        std::string                 name;
        std::optional<FlagOption>   flag;
        std::optional<ValueOption>  value;
    };

    // Cursor over argv shared by the token handlers.
    struct Tokens {
        int    count;
        char** values;
        int    index;

        auto current() const -> std::string_view { return values[index]; }
        auto hasNext() const -> bool { return index + 1 < count; }
        auto peek() const -> std::string_view { return values[index + 1]; }
    };

    auto lookup(std::string_view name) -> Registered*;
    auto registerOption(Registered option) -> void;
    auto handlePositional(std::string_view token) -> void;
    auto handleOption(Tokens& tokens) -> void;
    auto fail(std::string_view message) -> void;

    static auto isOptionToken(std::string_view token) -> bool;

    std::vector<Registered>                      registered;
    std::unordered_map<std::string, std::size_t> byName;
    std::string                                  programName{"roadpath"};
    std::function<ParseError(std::string_view)>  onPositional;
    std::function<bool(std::string_view)>        onUnknown;
    std::function<void(std::string const&)>      errorLogger;
    bool                                         failed = false;
};

} // namespace RP::Tools::CLI
