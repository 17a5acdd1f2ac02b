#pragma once

#include <sys/types.h>

#include <string>

namespace permsnap::permissions {

// Ten characters: type, then rwx triplets for owner, group and others with the
// setuid/setgid/sticky overlays rendered as s/S and t/T.
[[nodiscard]] std::string symbolic(mode_t mode);

// Permission bits only (no type or special bits), three octal digits.
[[nodiscard]] std::string octal(mode_t mode);

} // namespace permsnap::permissions
