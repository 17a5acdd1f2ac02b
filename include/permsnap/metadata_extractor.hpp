#pragma once

#include "permsnap/entry.hpp"

#include <optional>
#include <string>
#include <system_error>

namespace permsnap {

struct ExtractOptions {
    // Inspect the target of a symbolic link rather than the link itself.
    bool dereference = true;
};

class MetadataExtractor {
public:
    using Options = ExtractOptions;

    MetadataExtractor() = default;
    explicit MetadataExtractor(Options options);

    // A vanished path yields an all-sentinel entry. Any other status failure
    // (permission denied included) yields no entry and sets ec.
    [[nodiscard]] std::optional<FileSystemEntry> extract(const std::string& path, std::error_code& ec) const;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    Options options_{};
};

} // namespace permsnap
