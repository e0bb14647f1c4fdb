#pragma once
#include "core/Error.hpp"
#include "path/RoadPath.hpp"

#include <concepts>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// String-in, string-out equivalents of the RoadPath operations. Returned paths
// are in the lexical form produced by RoadPath::string().
namespace RP::path {

template <typename... Segments>
    requires(std::constructible_from<std::filesystem::path, Segments const&> && ...)
auto join(Segments const&... segments) -> std::string {
    std::filesystem::path joined;
    ((joined /= std::filesystem::path(segments)), ...);
    return RoadPath{std::move(joined)}.string();
}
auto join(std::span<std::string const> segments) -> std::string;

auto split(std::string_view path) -> std::pair<std::string, std::string>;
auto dirname(std::string_view path) -> std::string;
auto basename(std::string_view path) -> std::string;
auto splitext(std::string_view path) -> std::pair<std::string, std::string>;

auto normalize(std::string_view path) -> std::string;
auto absolute(std::string_view path) -> Expected<std::string>;
auto resolve(std::string_view path) -> Expected<std::string>;
auto relative(std::string_view path, std::optional<std::string_view> base = std::nullopt) -> Expected<std::string>;

auto expanduser(std::string_view path) -> std::string;
auto expandvars(std::string_view path) -> std::string;
auto expand(std::string_view path) -> std::string;

auto commonpath(std::vector<std::string> const& paths) -> Expected<std::string>;
auto commonprefix(std::vector<std::string> const& paths) -> std::string;
auto samefile(std::string_view first, std::string_view second) -> Expected<bool>;

} // namespace RP::path
