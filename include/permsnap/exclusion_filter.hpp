#pragma once

#include "permsnap/path_utils.hpp"

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace permsnap {

/// Decides which paths a walk leaves out.
///
/// Directories are matched by component multiset: a rule excludes a directory when
/// each of the rule's components occurs in the directory path at least as often,
/// wherever it appears. "/a/b" therefore excludes both "/x/a/b" and "/b/c/a".
/// Files are matched by exact path string, or by a byproduct suffix on the name.
class ExclusionFilter {
public:
    ExclusionFilter();
    explicit ExclusionFilter(std::vector<std::string> rules,
                             std::vector<std::string> byproduct_suffixes = default_byproduct_suffixes());

    [[nodiscard]] static std::vector<std::string> default_byproduct_suffixes();

    [[nodiscard]] bool excludes_directory(std::string_view normalized_path) const;
    [[nodiscard]] bool excludes_file(std::string_view full_path) const;
    [[nodiscard]] bool is_byproduct(std::string_view name) const;

    // Rules as supplied, empty ones dropped.
    [[nodiscard]] const std::vector<std::string>& rules() const noexcept { return rules_; }
    [[nodiscard]] const std::vector<std::string>& byproduct_suffixes() const noexcept { return byproduct_suffixes_; }

    void add_rule(std::string rule);
    // Matches the exact file path only; never applied to directories.
    void add_file_rule(std::string path);

private:
    std::vector<std::string> rules_;
    std::set<std::string, std::less<>> file_rules_;
    std::vector<path_utils::ComponentCounts> directory_rules_;
    std::vector<std::string> byproduct_suffixes_;
};

} // namespace permsnap
