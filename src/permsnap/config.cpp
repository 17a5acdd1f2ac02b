#include "permsnap/config.hpp"

#include <set>

namespace permsnap {

std::filesystem::path Config::output_path() const {
    if (data_.output && !data_.output->empty()) {
        return std::filesystem::path{*data_.output};
    }
    return std::filesystem::path{data_.os + "_files.json"};
}

std::vector<std::string> Config::sorted_ignore_list() const {
    std::set<std::string> unique(data_.ignore.begin(), data_.ignore.end());
    return {unique.begin(), unique.end()};
}

const std::vector<std::string>& Config::supported_operating_systems() {
    static const std::vector<std::string> systems{"linux", "windows", "redhat", "debian"};
    return systems;
}

} // namespace permsnap
