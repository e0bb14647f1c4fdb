#pragma once
#include <string_view>

namespace RP {

auto is_glob(std::string_view const& strv) -> bool;

/**
 * A single path component pattern. Supports '*', '?', bracket classes
 * ("[abc]", "[a-z]", "[!x]") and backslash escapes. Matching is
 * case-sensitive and never crosses a '/'.
 */
struct GlobName {
    GlobName(char const* const ptr);
    GlobName(std::string_view view);

    auto match(std::string_view const& str) const -> bool;

    auto isGlob() const -> bool;
    auto isRecursive() const -> bool;

private:
    std::string_view name;
};

} // namespace RP
