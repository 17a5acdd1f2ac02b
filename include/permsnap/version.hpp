#pragma once

#include <string_view>

#ifndef PERMSNAP_VERSION_STRING
#define PERMSNAP_VERSION_STRING "0.0"
#endif

namespace permsnap {

class Version {
public:
    static constexpr std::string_view String() noexcept { return std::string_view{PERMSNAP_VERSION_STRING}; }
};

} // namespace permsnap
