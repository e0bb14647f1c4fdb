#include "tools/ToolCli.hpp"

#include <charconv>
#include <iostream>
#include <utility>

namespace RP::Tools::CLI {

namespace {

auto parse_int(std::string_view text) -> std::optional<int> {
    int        value = 0;
    auto const last  = text.data() + text.size();
    auto const [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

} // namespace

ToolCli::ToolCli() {
    this->onUnknown = [this](std::string_view token) {
        this->fail("unknown option '" + std::string{token} + "'");
        return false;
    };
}

auto ToolCli::set_program_name(std::string_view name) -> void {
    this->programName = std::string{name};
}

auto ToolCli::set_positional_handler(std::function<ParseError(std::string_view)> handler) -> void {
    this->onPositional = std::move(handler);
}

auto ToolCli::set_unknown_argument_handler(std::function<bool(std::string_view)> handler) -> void {
    this->onUnknown = std::move(handler);
}

auto ToolCli::set_error_logger(std::function<void(std::string const&)> logger) -> void {
    this->errorLogger = std::move(logger);
}

auto ToolCli::add_flag(std::string_view name, FlagOption option) -> void {
    this->registerOption(Registered{.name = std::string{name}, .flag = std::move(option), .value = std::nullopt});
}

auto ToolCli::add_value(std::string_view name, ValueOption option) -> void {
    this->registerOption(Registered{.name = std::string{name}, .flag = std::nullopt, .value = std::move(option)});
}

auto ToolCli::add_int(std::string_view name, IntOption option) -> void {
    ValueOption wrapped{};
    // Negative numbers start with '-' and must not be mistaken for options.
    wrapped.allow_leading_dash_value = true;
    wrapped.on_value = [label = std::string{name}, handler = std::move(option.on_value)](
                               std::optional<std::string_view> token) -> ParseError {
        if (!token || token->empty()) {
            return label + " requires an integer value";
        }
        auto const parsed = parse_int(*token);
        if (!parsed) {
            return label + " expects a numeric value";
        }
        if (handler) {
            handler(*parsed);
        }
        return std::nullopt;
    };
    this->add_value(name, std::move(wrapped));
}

auto ToolCli::add_alias(std::string_view alias, std::string_view target) -> void {
    auto const found = this->byName.find(std::string{target});
    if (found == this->byName.end()) {
        this->fail("missing option for alias '" + std::string{target} + "'");
        return;
    }
    this->byName.insert_or_assign(std::string{alias}, found->second);
}

auto ToolCli::parse(int argc, char** argv) -> bool {
    this->failed = false;
    for (Tokens tokens{.count = argc, .values = argv, .index = 1}; tokens.index < argc; ++tokens.index) {
        if (isOptionToken(tokens.current())) {
            this->handleOption(tokens);
        } else {
            this->handlePositional(tokens.current());
        }
    }
    return !this->failed;
}

auto ToolCli::had_errors() const -> bool {
    return this->failed;
}

auto ToolCli::lookup(std::string_view name) -> Registered* {
    auto const found = this->byName.find(std::string{name});
    return found == this->byName.end() ? nullptr : &this->registered[found->second];
}

auto ToolCli::registerOption(Registered option) -> void {
    auto const index = this->registered.size();
    this->byName.insert_or_assign(option.name, index);
    this->registered.push_back(std::move(option));
}

auto ToolCli::handlePositional(std::string_view token) -> void {
    if (this->onPositional) {
        if (auto error = this->onPositional(token)) {
            this->fail(*error);
        }
        return;
    }
    if (this->onUnknown && !this->onUnknown(token)) {
        this->failed = true;
    }
}

auto ToolCli::handleOption(Tokens& tokens) -> void {
    auto const token = tokens.current();
    auto const equals = token.find('=');
    auto const name   = token.substr(0, equals);

    std::optional<std::string_view> value;
    if (equals != std::string_view::npos) {
        value = token.substr(equals + 1);
    }

    auto* option = this->lookup(name);
    if (option == nullptr) {
        if (this->onUnknown && !this->onUnknown(token)) {
            this->failed = true;
        }
        return;
    }

    if (option->flag) {
        if (value && !value->empty()) {
            this->fail(option->name + " does not accept a value");
        } else if (option->flag->on_set) {
            option->flag->on_set();
        }
        return;
    }

    auto const& spec = *option->value;
    if (!value && tokens.hasNext() && (spec.allow_leading_dash_value || !isOptionToken(tokens.peek()))) {
        ++tokens.index;
        value = tokens.current();
    }
    if (!value && !spec.value_optional) {
        this->fail(option->name + " requires a value");
        return;
    }
    if (spec.on_value) {
        if (auto error = spec.on_value(value)) {
            this->fail(*error);
        }
    }
}

auto ToolCli::fail(std::string_view message) -> void {
    this->failed = true;
    auto line    = this->programName + ": " + std::string{message};
    if (this->errorLogger) {
        this->errorLogger(line);
    } else {
        std::cerr << line << '\n';
    }
}

auto ToolCli::isOptionToken(std::string_view token) -> bool {
    return token.size() > 1 && token.front() == '-';
}

} // namespace RP::Tools::CLI
