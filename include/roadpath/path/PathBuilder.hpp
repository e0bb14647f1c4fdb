#pragma once
#include "path/RoadPath.hpp"

#include <concepts>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace RP {

/**
 * Mutable accumulator of path segments. parent() appends a literal ".."
 * instead of dropping the previous segment. build() joins the segments with
 * RoadPath join rules, without normalizing and without clearing them, so a
 * builder can keep growing after being built.
 */
class PathBuilder {
public:
    PathBuilder() = default;
    explicit PathBuilder(std::string_view base);

    PathBuilder(const PathBuilder&)                = default;
    PathBuilder(PathBuilder&&) noexcept            = default;
    PathBuilder& operator=(const PathBuilder&)     = default;
    PathBuilder& operator=(PathBuilder&&) noexcept = default;
    ~PathBuilder()                                 = default;

    template <std::convertible_to<std::string_view>... Segments>
    auto add(Segments&&... segments) -> PathBuilder& {
        (this->append(std::string_view(std::forward<Segments>(segments))), ...);
        return *this;
    }
    auto parent() -> PathBuilder&;

    auto build() const -> RoadPath;
    auto segments() const noexcept -> std::vector<std::string> const&;
    auto string() const -> std::string;

private:
    auto append(std::string_view segment) -> void;

    std::vector<std::string> parts;
};

auto builder(std::string_view base = "") -> PathBuilder;

auto operator<<(std::ostream& os, PathBuilder const& builder) -> std::ostream&;

} // namespace RP
