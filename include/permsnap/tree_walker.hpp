#pragma once

#include "permsnap/entry.hpp"
#include "permsnap/exclusion_filter.hpp"
#include "permsnap/metadata_extractor.hpp"

#include <filesystem>
#include <stop_token>
#include <string>

namespace permsnap {

struct WalkOptions {
    // Record the root directory itself alongside its descendants.
    bool include_root = false;
};

struct WalkResult {
    Snapshot snapshot;
    WalkStats stats;
};

class TreeWalker {
public:
    TreeWalker(ExclusionFilter filter, MetadataExtractor extractor, WalkOptions options = {});

    // Depth-first walk that never descends through symbolic links. Per-path
    // failures are counted in the stats; a missing or unlistable root throws
    // SnapshotError. A stop request ends the walk between directories.
    [[nodiscard]] WalkResult walk(const std::filesystem::path& root, std::stop_token stop = {}) const;

    [[nodiscard]] const ExclusionFilter& filter() const noexcept { return filter_; }

private:
    void visit_directory(const std::string& directory, WalkResult& out, const std::stop_token& stop) const;
    void record(const std::string& path, WalkResult& out) const;

    ExclusionFilter filter_;
    MetadataExtractor extractor_;
    WalkOptions options_;
};

} // namespace permsnap
