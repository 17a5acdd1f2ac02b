#pragma once

#include "permsnap/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace permsnap {

class Config {
public:
    struct Data {
        std::string root {};
        std::string os {};
        std::vector<std::string> ignore {};
        std::optional<std::string> output {};
        std::optional<std::vector<std::string>> byproduct_suffixes {};

        bool show_ignore_list { true };
        bool dereference { true };
        bool include_root { false };

        Logger::Level log_level { Logger::Level::Warning };
    };

    Config() = default;

    [[nodiscard]] const Data& data() const noexcept { return data_; }
    [[nodiscard]] Data& data() noexcept { return data_; }

    // Explicit --output, otherwise "<os>_files.json" in the working directory.
    [[nodiscard]] std::filesystem::path output_path() const;

    // Ignore rules sorted and deduplicated, for display.
    [[nodiscard]] std::vector<std::string> sorted_ignore_list() const;

    [[nodiscard]] static const std::vector<std::string>& supported_operating_systems();

private:
    Data data_ {};
};

} // namespace permsnap
