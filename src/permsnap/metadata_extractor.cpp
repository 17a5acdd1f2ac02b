#include "permsnap/metadata_extractor.hpp"

#include "permsnap/logger.hpp"
#include "permsnap/permissions.hpp"
#include "permsnap/platform.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <utility>

namespace permsnap {

MetadataExtractor::MetadataExtractor(Options options)
    : options_(options) {}

std::optional<FileSystemEntry> MetadataExtractor::extract(const std::string& path, std::error_code& ec) const {
    ec.clear();

    struct stat st {};
    const int rc = options_.dereference ? ::stat(path.c_str(), &st) : ::lstat(path.c_str(), &st);
    if (rc != 0) {
        const int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            Logger::instance().debug("{} vanished before inspection", path);
            return FileSystemEntry::unavailable(path);
        }
        ec.assign(err, std::generic_category());
        return std::nullopt;
    }

    auto owner = platform::user_name(st.st_uid);
    auto group = platform::group_name(st.st_gid);
    if (!owner || !group) {
        Logger::instance().debug("{}: unresolved owner {} or group {}", path,
                                 static_cast<unsigned long>(st.st_uid), static_cast<unsigned long>(st.st_gid));
        return FileSystemEntry::unavailable(path);
    }

    FileSystemEntry entry;
    entry.path = path;
    entry.kind = S_ISDIR(st.st_mode) ? EntryKind::Directory : EntryKind::File;
    entry.owner = std::move(*owner);
    entry.group = std::move(*group);
    entry.mode_octal = permissions::octal(st.st_mode);
    entry.mode_symbolic = permissions::symbolic(st.st_mode);
    return entry;
}

} // namespace permsnap
