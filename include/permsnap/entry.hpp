#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

namespace permsnap {

// Placeholder written for every descriptive field that could not be read.
inline constexpr std::string_view unavailable_marker{"-"};

enum class EntryKind {
    File,
    Directory,
    Unknown
};

[[nodiscard]] std::string_view to_string(EntryKind kind) noexcept;

struct FileSystemEntry {
    std::string path;
    EntryKind kind{EntryKind::Unknown};
    std::string owner{unavailable_marker};
    std::string group{unavailable_marker};
    std::string mode_octal{unavailable_marker};
    std::string mode_symbolic{unavailable_marker};

    // Record for a path whose status or ownership could not be resolved.
    [[nodiscard]] static FileSystemEntry unavailable(std::string path);

    [[nodiscard]] bool is_unavailable() const noexcept { return kind == EntryKind::Unknown; }

    bool operator==(const FileSystemEntry&) const = default;
};

// Keyed by normalized path; std::map keeps the byte-wise lexicographic order the
// serialized form requires.
using Snapshot = std::map<std::string, FileSystemEntry>;

struct WalkStats {
    std::size_t directories{0};
    std::size_t files{0};
    std::size_t excluded_directories{0};
    std::size_t excluded_files{0};
    std::size_t byproduct_files{0};
    std::size_t unavailable{0};
    std::size_t denied{0};
    std::size_t unreadable_directories{0};
    bool cancelled{false};
};

class SnapshotError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void to_json(nlohmann::json& j, const FileSystemEntry& entry);

} // namespace permsnap
