#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace RP {

/**
 * Home directory lookup. An empty user name means the current user: $HOME
 * when set and non-empty, otherwise the passwd entry of getuid(). Any other
 * name is looked up with getpwnam_r. Returns nullopt when nothing is found.
 */
auto user_home_directory(std::string_view user = {}) -> std::optional<std::string>;

} // namespace RP
