#include "roadpath.hpp"
#include "tools/PathPartsJson.hpp"
#include "tools/ToolCli.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct InspectOptions {
    std::vector<std::string>   paths;
    std::optional<std::string> relativeTo;
    std::optional<std::string> globPattern;
    int                        indent    = 2;
    bool                       resolve   = false;
    bool                       absolute  = false;
    bool                       expand    = false;
    bool                       normalize = false;
};

void print_usage() {
    std::cout << "Usage: roadpath_inspect [options] <path>...\n"
                 "Options:\n"
                 "  --indent <n>          JSON indent (default 2, -1 for compact)\n"
                 "  --resolve             Add the resolved path\n"
                 "  --absolute            Add the absolute path\n"
                 "  --expand              Expand '~' and environment variables in each argument first\n"
                 "  --normalize           Add the lexically normalized path\n"
                 "  --relative-to <base>  Add the path relative to base\n"
                 "  --glob <pattern>      Add entries matching pattern below each path\n"
                 "  --help                Show this message\n";
}

auto parse_cli(int argc, char** argv) -> std::optional<InspectOptions> {
    using RP::Tools::CLI::ToolCli;
    InspectOptions options;

    ToolCli cli;
    cli.set_program_name("roadpath_inspect");
    cli.set_error_logger([](std::string const& message) { std::cerr << message << "\n"; });
    cli.set_positional_handler([&](std::string_view token) -> ToolCli::ParseError {
        options.paths.emplace_back(token);
        return std::nullopt;
    });

    cli.add_int("--indent", {.on_value = [&](int value) { options.indent = value; }});

    ToolCli::ValueOption relativeOption{};
    relativeOption.on_value = [&](std::optional<std::string_view> value) -> ToolCli::ParseError {
        if (!value || value->empty()) {
            return std::string{"--relative-to requires a base path"};
        }
        options.relativeTo = std::string{*value};
        return std::nullopt;
    };
    cli.add_value("--relative-to", std::move(relativeOption));

    ToolCli::ValueOption globOption{};
    globOption.on_value = [&](std::optional<std::string_view> value) -> ToolCli::ParseError {
        if (!value || value->empty()) {
            return std::string{"--glob requires a pattern"};
        }
        options.globPattern = std::string{*value};
        return std::nullopt;
    };
    cli.add_value("--glob", std::move(globOption));

    cli.add_flag("--resolve", {.on_set = [&] { options.resolve = true; }});
    cli.add_flag("--absolute", {.on_set = [&] { options.absolute = true; }});
    cli.add_flag("--expand", {.on_set = [&] { options.expand = true; }});
    cli.add_flag("--normalize", {.on_set = [&] { options.normalize = true; }});

    auto helpHandler = [] {
        print_usage();
        std::exit(0);
    };
    cli.add_flag("--help", {.on_set = helpHandler});
    cli.add_alias("-h", "--help");

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    if (options.paths.empty()) {
        std::cerr << "roadpath_inspect: at least one path is required\n";
        return std::nullopt;
    }
    return options;
}

template <typename T>
void put_expected(nlohmann::json& json, std::string const& key, RP::Expected<T> const& value) {
    if (value) {
        json[key] = value->string();
    } else {
        json[key + "_error"] = value.error();
    }
}

auto inspect(std::string const& argument, InspectOptions const& options) -> nlohmann::json {
    auto const         text = options.expand ? RP::path::expand(argument) : argument;
    RP::RoadPath const path{text};

    auto json = RP::describePath(path);
    if (options.normalize) {
        json["normalized"] = path.normalize().string();
    }
    if (options.absolute) {
        put_expected(json, "absolute", path.absolute());
    }
    if (options.resolve) {
        put_expected(json, "resolved", path.resolve());
    }
    if (options.relativeTo) {
        put_expected(json, "relative", path.relative_to(RP::RoadPath{*options.relativeTo}));
    }
    if (options.globPattern) {
        auto matches = nlohmann::json::array();
        for (auto const& match : path.glob(*options.globPattern)) {
            matches.push_back(match.string());
        }
        json["matches"] = std::move(matches);
    }
    return json;
}

} // namespace

int main(int argc, char** argv) {
    auto cliOptions = parse_cli(argc, argv);
    if (!cliOptions) {
        print_usage();
        return EXIT_FAILURE;
    }

    auto output = nlohmann::json::array();
    for (auto const& argument : cliOptions->paths) {
        output.push_back(inspect(argument, *cliOptions));
    }

    std::cout << RP::dumpJson(output, cliOptions->indent) << std::endl;
    return EXIT_SUCCESS;
}
