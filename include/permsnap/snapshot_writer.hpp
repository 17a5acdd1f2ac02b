#pragma once

#include "permsnap/entry.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <iosfwd>

namespace permsnap {

// {"data": [{"id": 0, "name": <path>, "description": {...}}, ...]} with entries in
// ascending path order and ids counted from zero.
[[nodiscard]] nlohmann::json to_document(const Snapshot& snapshot);

void write_snapshot(const Snapshot& snapshot, std::ostream& os);

// Throws SnapshotError when the file cannot be written.
void write_snapshot_file(const Snapshot& snapshot, const std::filesystem::path& destination);

} // namespace permsnap
