#pragma once

#include <sys/types.h>

#include <optional>
#include <string>

namespace permsnap::platform {

[[nodiscard]] std::optional<std::string> user_name(uid_t uid);
[[nodiscard]] std::optional<std::string> group_name(gid_t gid);

} // namespace permsnap::platform
