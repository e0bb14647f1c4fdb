#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

namespace RP {

/**
 * Expands a relative, component-split glob pattern below base.
 *
 * Each component is matched against the entries of the directories reached so
 * far. A component without wildcards is kept when it exists, "**" stands for
 * base itself and every directory below it (symlinked directories are not
 * entered). Results are joined onto base and returned in enumeration order
 * without duplicates. Unreadable directories are skipped.
 */
auto glob_walk(std::filesystem::path const& base, std::vector<std::string_view> const& pattern)
    -> std::vector<std::filesystem::path>;

} // namespace RP
