#include "permsnap/exclusion_filter.hpp"

#include "permsnap/logger.hpp"

#include <algorithm>
#include <utility>

namespace permsnap {

ExclusionFilter::ExclusionFilter()
    : byproduct_suffixes_(default_byproduct_suffixes()) {}

ExclusionFilter::ExclusionFilter(std::vector<std::string> rules, std::vector<std::string> byproduct_suffixes)
    : byproduct_suffixes_(std::move(byproduct_suffixes)) {
    for (auto& rule : rules) {
        add_rule(std::move(rule));
    }
    byproduct_suffixes_.erase(std::remove(byproduct_suffixes_.begin(), byproduct_suffixes_.end(), std::string{}),
                              byproduct_suffixes_.end());
}

std::vector<std::string> ExclusionFilter::default_byproduct_suffixes() {
    return {".pyc"};
}

void ExclusionFilter::add_rule(std::string rule) {
    if (rule.empty()) {
        Logger::instance().debug("ignoring empty exclusion rule");
        return;
    }

    auto counts = path_utils::component_counts(path_utils::strip_leading_separators(rule));
    if (counts.empty()) {
        Logger::instance().debug("exclusion rule '{}' names no directory component", rule);
    } else {
        directory_rules_.push_back(std::move(counts));
    }
    file_rules_.insert(rule);
    rules_.push_back(std::move(rule));
}

void ExclusionFilter::add_file_rule(std::string path) {
    if (!path.empty()) {
        file_rules_.insert(std::move(path));
    }
}

bool ExclusionFilter::excludes_directory(std::string_view normalized_path) const {
    if (directory_rules_.empty()) {
        return false;
    }
    const auto counts = path_utils::component_counts(path_utils::strip_leading_separators(normalized_path));
    return std::any_of(directory_rules_.begin(), directory_rules_.end(), [&](const auto& rule) {
        return path_utils::contains_all(counts, rule);
    });
}

bool ExclusionFilter::excludes_file(std::string_view full_path) const {
    return file_rules_.find(full_path) != file_rules_.end();
}

bool ExclusionFilter::is_byproduct(std::string_view name) const {
    return std::any_of(byproduct_suffixes_.begin(), byproduct_suffixes_.end(), [&](const std::string& suffix) {
        return path_utils::ends_with(name, suffix);
    });
}

} // namespace permsnap
