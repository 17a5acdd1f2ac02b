#include "permsnap/entry.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace permsnap {

std::string_view to_string(EntryKind kind) noexcept {
    switch (kind) {
        case EntryKind::File:
            return "file";
        case EntryKind::Directory:
            return "directory";
        case EntryKind::Unknown:
            break;
    }
    return unavailable_marker;
}

FileSystemEntry FileSystemEntry::unavailable(std::string path) {
    FileSystemEntry entry;
    entry.path = std::move(path);
    return entry;
}

void to_json(nlohmann::json& j, const FileSystemEntry& entry) {
    j = {
        {"group", entry.group},
        {"mode", entry.mode_octal},
        {"prot", entry.mode_symbolic},
        {"type", std::string{to_string(entry.kind)}},
        {"user", entry.owner}
    };
}

} // namespace permsnap
