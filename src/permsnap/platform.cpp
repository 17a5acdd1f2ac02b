#include "permsnap/platform.hpp"

#include <grp.h>
#include <pwd.h>

namespace permsnap::platform {

std::optional<std::string> user_name(uid_t uid) {
    if (auto* pw = ::getpwuid(uid); pw != nullptr && pw->pw_name != nullptr) {
        return std::string{pw->pw_name};
    }
    return std::nullopt;
}

std::optional<std::string> group_name(gid_t gid) {
    if (auto* gr = ::getgrgid(gid); gr != nullptr && gr->gr_name != nullptr) {
        return std::string{gr->gr_name};
    }
    return std::nullopt;
}

} // namespace permsnap::platform
