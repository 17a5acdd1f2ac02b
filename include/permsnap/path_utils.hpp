#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace permsnap::path_utils {

inline constexpr char separator = '/';

// Collapses repeated separators and drops trailing ones. "/" stays "/".
inline std::string normalize(std::string_view path) {
    std::string result;
    result.reserve(path.size());
    for (char ch : path) {
        if (ch == separator && !result.empty() && result.back() == separator) {
            continue;
        }
        result.push_back(ch);
    }
    while (result.size() > 1 && result.back() == separator) {
        result.pop_back();
    }
    return result;
}

inline std::string_view strip_leading_separators(std::string_view path) {
    const auto first = path.find_first_not_of(separator);
    if (first == std::string_view::npos) {
        return {};
    }
    return path.substr(first);
}

// Non-empty separator-delimited components, in order.
inline std::vector<std::string_view> components(std::string_view path) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find(separator, start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        if (end > start) {
            parts.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

using ComponentCounts = std::map<std::string, std::size_t, std::less<>>;

inline ComponentCounts component_counts(std::string_view path) {
    ComponentCounts counts;
    for (auto part : components(path)) {
        auto it = counts.find(part);
        if (it == counts.end()) {
            counts.emplace(std::string{part}, 1);
        } else {
            ++it->second;
        }
    }
    return counts;
}

// True when every component of needle occurs in haystack at least as many times.
inline bool contains_all(const ComponentCounts& haystack, const ComponentCounts& needle) {
    for (const auto& [component, count] : needle) {
        auto it = haystack.find(component);
        if (it == haystack.end() || it->second < count) {
            return false;
        }
    }
    return true;
}

inline std::string join(std::string_view directory, std::string_view name) {
    std::string result{directory};
    if (result.empty() || result.back() != separator) {
        result.push_back(separator);
    }
    result.append(name);
    return result;
}

inline bool ends_with(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}

} // namespace permsnap::path_utils
