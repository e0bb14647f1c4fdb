#include "path/PathFunctions.hpp"

#include "log/TaggedLogger.hpp"
#include "path/LexicalPath.hpp"
#include "path/UserDirectory.hpp"

#include <algorithm>
#include <cstdlib>
#include <system_error>

namespace {

using RP::Error;
using RP::Expected;
using RP::RoadPath;

auto is_name_char(char ch) -> bool {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_';
}

auto lookup_env(std::string_view name) -> char const* {
    if (name.empty()) {
        return nullptr;
    }
    return std::getenv(std::string{name}.c_str());
}

} // namespace

namespace RP::path {

auto join(std::span<std::string const> segments) -> std::string {
    return RoadPath{}.join(segments).string();
}

auto split(std::string_view path) -> std::pair<std::string, std::string> {
    RoadPath const value{path};
    return {value.parent().string(), value.name()};
}

auto dirname(std::string_view path) -> std::string {
    return RoadPath{path}.parent().string();
}

auto basename(std::string_view path) -> std::string {
    return RoadPath{path}.name();
}

auto splitext(std::string_view path) -> std::pair<std::string, std::string> {
    RoadPath const value{path};
    if (value.name().empty()) {
        return {value.string(), std::string{}};
    }
    auto stripped = value.with_suffix("");
    if (!stripped) {
        return {value.string(), std::string{}};
    }
    return {stripped->string(), value.suffix()};
}

auto normalize(std::string_view path) -> std::string {
    return LexicalPathView{path}.normalized();
}

auto absolute(std::string_view path) -> Expected<std::string> {
    auto result = RoadPath{path}.absolute();
    if (!result) {
        return std::unexpected(result.error());
    }
    return result->string();
}

auto resolve(std::string_view path) -> Expected<std::string> {
    auto result = RoadPath{path}.resolve();
    if (!result) {
        return std::unexpected(result.error());
    }
    return result->string();
}

auto relative(std::string_view path, std::optional<std::string_view> base) -> Expected<std::string> {
    RoadPath baseline;
    if (base && !base->empty()) {
        baseline = RoadPath{*base};
    } else {
        auto current = RoadPath::cwd();
        if (!current) {
            return std::unexpected(current.error());
        }
        baseline = std::move(*current);
    }

    auto result = RoadPath{path}.relative_to(baseline);
    if (!result) {
        return std::unexpected(result.error());
    }
    return result->string();
}

auto expanduser(std::string_view path) -> std::string {
    if (path.empty() || path.front() != '~') {
        return std::string{path};
    }

    auto slash = path.find('/', 1);
    if (slash == std::string_view::npos) {
        slash = path.size();
    }

    auto home = user_home_directory(path.substr(1, slash - 1));
    if (!home) {
        rp_log("No home directory for " + std::string{path.substr(0, slash)}, "RoadPath");
        return std::string{path};
    }

    while (!home->empty() && home->back() == '/') {
        home->pop_back();
    }
    home->append(path.substr(slash));
    if (home->empty()) {
        return "/";
    }
    return std::move(*home);
}

auto expandvars(std::string_view path) -> std::string {
    if (path.find('$') == std::string_view::npos) {
        return std::string{path};
    }

    std::string result;
    result.reserve(path.size());
    std::size_t pos = 0;
    while (pos < path.size()) {
        auto const dollar = path.find('$', pos);
        if (dollar == std::string_view::npos) {
            result.append(path.substr(pos));
            break;
        }
        result.append(path.substr(pos, dollar - pos));

        auto const       cursor = dollar + 1;
        auto             end    = cursor;
        std::string_view name;
        if (cursor < path.size() && path[cursor] == '{') {
            auto const close = path.find('}', cursor + 1);
            if (close == std::string_view::npos) {
                result.push_back('$');
                pos = cursor;
                continue;
            }
            name = path.substr(cursor + 1, close - cursor - 1);
            end  = close + 1;
        } else {
            while (end < path.size() && is_name_char(path[end])) {
                ++end;
            }
            name = path.substr(cursor, end - cursor);
        }

        if (end == cursor) {
            // Lone '$'
            result.push_back('$');
            pos = cursor;
            continue;
        }

        if (char const* value = lookup_env(name)) {
            result.append(value);
        } else {
            result.append(path.substr(dollar, end - dollar));
        }
        pos = end;
    }
    return result;
}

auto expand(std::string_view path) -> std::string {
    return expandvars(expanduser(path));
}

auto commonpath(std::vector<std::string> const& paths) -> Expected<std::string> {
    if (paths.empty()) {
        return std::unexpected(Error{Error::Code::InvalidPath, "commonpath needs at least one path"});
    }

    bool const absolute = LexicalPathView{paths.front()}.is_absolute();
    std::vector<std::vector<std::string_view>> split;
    split.reserve(paths.size());
    for (auto const& entry : paths) {
        LexicalPathView const view{entry};
        if (view.is_absolute() != absolute) {
            return std::unexpected(Error{Error::Code::MixedAbsoluteRelative, "can't mix absolute and relative paths"});
        }
        split.push_back(view.components());
    }

    auto common = split.front();
    bool bare   = false;
    for (auto const& components : split) {
        bare = bare || components.empty();
        auto const mismatch =
            std::mismatch(common.begin(), common.end(), components.begin(), components.end());
        common.erase(mismatch.first, common.end());
    }

    if (common.empty() && !bare) {
        return std::unexpected(Error{Error::Code::NoCommonPath, "paths share no common ancestor"});
    }
    return render_components(absolute, common);
}

auto commonprefix(std::vector<std::string> const& paths) -> std::string {
    if (paths.empty()) {
        return {};
    }
    auto const [shortest, longest] = std::minmax_element(paths.begin(), paths.end());
    auto const mismatch = std::mismatch(shortest->begin(), shortest->end(), longest->begin(), longest->end());
    return std::string{shortest->begin(), mismatch.first};
}

auto samefile(std::string_view first, std::string_view second) -> Expected<bool> {
    std::error_code ec;
    for (auto const candidate : {first, second}) {
        auto const status = std::filesystem::status(std::filesystem::path{candidate}, ec);
        if (!ec && !std::filesystem::exists(status)) {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        if (ec) {
            return std::unexpected(fromErrorCode(ec, "cannot stat '" + std::string{candidate} + "'"));
        }
    }

    bool const same = std::filesystem::equivalent(std::filesystem::path{first}, std::filesystem::path{second}, ec);
    if (ec) {
        return std::unexpected(fromErrorCode(ec, "samefile '" + std::string{first} + "', '" + std::string{second} + "'"));
    }
    return same;
}

} // namespace RP::path
