#include "permsnap/tree_walker.hpp"

#include "permsnap/logger.hpp"
#include "permsnap/path_utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <system_error>
#include <utility>
#include <vector>

namespace permsnap {

namespace {

std::string absolute_normalized(const std::filesystem::path& root) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(root, ec);
    if (ec) {
        throw SnapshotError(fmt::format("cannot resolve {}: {}", root.string(), ec.message()));
    }
    return path_utils::normalize(absolute.lexically_normal().string());
}

} // namespace

TreeWalker::TreeWalker(ExclusionFilter filter, MetadataExtractor extractor, WalkOptions options)
    : filter_(std::move(filter))
    , extractor_(std::move(extractor))
    , options_(options) {}

WalkResult TreeWalker::walk(const std::filesystem::path& root, std::stop_token stop) const {
    const std::string root_path = absolute_normalized(root);

    std::error_code ec;
    const auto status = std::filesystem::status(root_path, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw SnapshotError(fmt::format("path does not exist: {}", root_path));
    }
    if (!std::filesystem::is_directory(status)) {
        throw SnapshotError(fmt::format("path is not a directory: {}", root_path));
    }
    std::filesystem::directory_iterator probe{root_path, ec};
    if (ec) {
        throw SnapshotError(fmt::format("cannot read {}: {}", root_path, ec.message()));
    }

    WalkResult out;
    if (filter_.excludes_directory(root_path)) {
        Logger::instance().info("root {} matches an exclusion rule, nothing to record", root_path);
        ++out.stats.excluded_directories;
        return out;
    }

    if (options_.include_root) {
        record(root_path, out);
    }
    visit_directory(root_path, out, stop);
    return out;
}

void TreeWalker::visit_directory(const std::string& directory, WalkResult& out, const std::stop_token& stop) const {
    auto& logger = Logger::instance();
    if (stop.stop_requested()) {
        out.stats.cancelled = true;
        return;
    }
    logger.trace("visiting {}", directory);

    std::error_code ec;
    std::vector<std::string> subdirectories;
    std::filesystem::directory_iterator it{directory, ec};
    if (ec) {
        logger.warn("cannot list {}: {}", directory, ec.message());
        ++out.stats.unreadable_directories;
        return;
    }

    for (; !ec && it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        std::string child = path_utils::join(directory, name);

        std::error_code type_ec;
        if (it->symlink_status(type_ec).type() == std::filesystem::file_type::directory) {
            subdirectories.push_back(std::move(child));
            continue;
        }

        if (filter_.is_byproduct(name)) {
            ++out.stats.byproduct_files;
            continue;
        }
        if (filter_.excludes_file(child)) {
            logger.debug("excluded file {}", child);
            ++out.stats.excluded_files;
            continue;
        }
        record(child, out);
    }
    if (ec) {
        logger.warn("listing of {} stopped early: {}", directory, ec.message());
        ++out.stats.unreadable_directories;
    }

    std::sort(subdirectories.begin(), subdirectories.end());
    for (const auto& subdirectory : subdirectories) {
        if (stop.stop_requested()) {
            out.stats.cancelled = true;
            return;
        }
        if (filter_.excludes_directory(subdirectory)) {
            logger.debug("excluded directory {}", subdirectory);
            ++out.stats.excluded_directories;
            continue;
        }
        record(subdirectory, out);
        visit_directory(subdirectory, out, stop);
    }
}

void TreeWalker::record(const std::string& path, WalkResult& out) const {
    std::error_code ec;
    auto entry = extractor_.extract(path, ec);
    if (!entry) {
        Logger::instance().warn("cannot inspect {}: {}", path, ec.message());
        ++out.stats.denied;
        return;
    }

    if (entry->is_unavailable()) {
        ++out.stats.unavailable;
    } else if (entry->kind == EntryKind::Directory) {
        ++out.stats.directories;
    } else {
        ++out.stats.files;
    }
    out.snapshot.emplace(path, std::move(*entry));
}

} // namespace permsnap
