#pragma once
#include "core/Error.hpp"
#include "path/PathParts.hpp"

#include <compare>
#include <concepts>
#include <filesystem>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace RP {

/**
 * Immutable wrapper around one filesystem path.
 *
 * The string given at construction is kept untouched (raw()). Accessors,
 * comparison and string() work on the lexical form: repeated separators
 * collapsed, '.' components and trailing separators dropped, '..' kept.
 * The lexical form of an empty path is ".".
 *
 * Every transformation returns a new RoadPath. Operations that can fail
 * return Expected; filesystem predicates report false instead of failing.
 */
class RoadPath {
public:
    RoadPath() = default;
    RoadPath(std::string_view path);
    RoadPath(char const* path);
    RoadPath(std::string const& path);
    RoadPath(std::filesystem::path path);

    static auto cwd() -> Expected<RoadPath>;
    static auto home() -> Expected<RoadPath>;
    static auto temp() -> Expected<RoadPath>;

    auto string() const -> std::string;
    auto raw() const noexcept -> std::string const&;
    auto native() const noexcept -> std::filesystem::path const&;
    auto repr() const -> std::string;

    auto name() const -> std::string;
    auto stem() const -> std::string;
    auto suffix() const -> std::string;
    auto suffixes() const -> std::vector<std::string>;
    auto parent() const -> RoadPath;
    auto parents() const -> std::vector<RoadPath>;
    auto parts() const -> std::vector<std::string>;
    auto parse() const -> PathParts;

    auto operator/(std::string_view segment) const -> RoadPath;
    auto operator/(char const* segment) const -> RoadPath;
    auto operator/(std::string const& segment) const -> RoadPath;
    auto operator/(RoadPath const& segment) const -> RoadPath;

    template <typename... Segments>
        requires(std::constructible_from<std::filesystem::path, Segments const&> && ...)
    auto join(Segments const&... segments) const -> RoadPath {
        auto joined = this->path;
        ((joined /= std::filesystem::path(segments)), ...);
        return RoadPath{std::move(joined)};
    }
    auto join(std::span<std::string const> segments) const -> RoadPath;

    auto absolute() const -> Expected<RoadPath>;
    auto resolve() const -> Expected<RoadPath>;
    auto normalize() const -> RoadPath;
    auto relative_to(RoadPath const& base) const -> Expected<RoadPath>;
    auto with_name(std::string_view name) const -> Expected<RoadPath>;
    auto with_stem(std::string_view stem) const -> Expected<RoadPath>;
    auto with_suffix(std::string_view suffix) const -> Expected<RoadPath>;
    auto match(std::string_view pattern) const -> bool;

    auto exists() const -> bool;
    auto is_file() const -> bool;
    auto is_dir() const -> bool;
    auto is_symlink() const -> bool;
    auto is_absolute() const -> bool;

    auto glob(std::string_view pattern) const -> std::vector<RoadPath>;
    auto rglob(std::string_view pattern) const -> std::vector<RoadPath>;

    auto operator==(RoadPath const& other) const -> bool;
    auto operator<=>(RoadPath const& other) const -> std::strong_ordering;

private:
    // Path handed to the platform; the empty path means the current directory.
    auto effective() const -> std::filesystem::path;

    std::filesystem::path path;
};

auto operator<<(std::ostream& os, RoadPath const& path) -> std::ostream&;

} // namespace RP
