#include "path/UserDirectory.hpp"

#include "log/TaggedLogger.hpp"

#include <cerrno>
#include <cstdlib>
#include <vector>

#include <pwd.h>
#include <unistd.h>

namespace {

auto passwd_buffer_size() -> std::size_t {
    auto const suggested = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    return suggested > 0 ? static_cast<std::size_t>(suggested) : 16384u;
}

template <typename Lookup>
auto lookup_passwd_home(Lookup&& lookup) -> std::optional<std::string> {
    std::vector<char> buffer(passwd_buffer_size());
    struct passwd     entry {};
    struct passwd*    result = nullptr;

    int status = lookup(&entry, buffer.data(), buffer.size(), &result);
    while (status == ERANGE && buffer.size() < (1u << 20)) {
        buffer.resize(buffer.size() * 2);
        status = lookup(&entry, buffer.data(), buffer.size(), &result);
    }
    if (status != 0) {
        rp_log("passwd lookup failed with errno " + std::to_string(status), "ERROR");
        return std::nullopt;
    }
    if (result == nullptr || result->pw_dir == nullptr) {
        return std::nullopt;
    }
    return std::string{result->pw_dir};
}

} // namespace

namespace RP {

auto user_home_directory(std::string_view user) -> std::optional<std::string> {
    if (user.empty()) {
        if (char const* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
            return std::string{home};
        }
        auto const uid = ::getuid();
        return lookup_passwd_home([uid](struct passwd* entry, char* buf, std::size_t len, struct passwd** result) {
            return ::getpwuid_r(uid, entry, buf, len, result);
        });
    }

    std::string const name{user};
    return lookup_passwd_home([&name](struct passwd* entry, char* buf, std::size_t len, struct passwd** result) {
        return ::getpwnam_r(name.c_str(), entry, buf, len, result);
    });
}

} // namespace RP
