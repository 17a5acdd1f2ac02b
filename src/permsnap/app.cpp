#include "permsnap/app.hpp"

#include "permsnap/exclusion_filter.hpp"
#include "permsnap/logger.hpp"
#include "permsnap/metadata_extractor.hpp"
#include "permsnap/path_utils.hpp"
#include "permsnap/perf.hpp"
#include "permsnap/snapshot_writer.hpp"
#include "permsnap/tree_walker.hpp"

#include <fmt/format.h>

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <system_error>

namespace permsnap {

App::App()
    : App(std::cout, std::cerr) {}

App::App(std::ostream& out, std::ostream& err)
    : out_(out), err_(err) {}

int App::run(int argc, char** argv) {
    Cli cli;
    Config config;
    if (const auto code = cli.parse(argc, argv, config)) {
        return *code;
    }

    auto& logger = Logger::instance();
    const auto& data = config.data();
    logger.debug("path={} os={} ignore={} output={}", data.root, data.os, data.ignore.size(),
                 config.output_path().string());

    try {
        out_ << "Checking files..." << std::endl;

        ExclusionFilter filter{data.ignore,
                               data.byproduct_suffixes.value_or(ExclusionFilter::default_byproduct_suffixes())};
        const auto output = config.output_path();
        std::error_code ec;
        const auto output_absolute = std::filesystem::absolute(output, ec);
        if (!ec) {
            filter.add_file_rule(path_utils::normalize(output_absolute.lexically_normal().string()));
        }

        TreeWalker walker{std::move(filter), MetadataExtractor{ExtractOptions{data.dereference}},
                          WalkOptions{data.include_root}};

        WalkResult result;
        {
            ScopedTimer timer("walk " + data.root);
            result = walker.walk(data.root);
        }
        if (result.stats.cancelled) {
            throw SnapshotError("walk cancelled before completion");
        }

        {
            ScopedTimer timer("write " + output.string());
            write_snapshot_file(result.snapshot, output);
        }

        print_summary(config, result.stats, result.snapshot.size());
        return 0;
    } catch (const SnapshotError& e) {
        logger.error("{}", e.what());
        err_ << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        logger.error("unexpected failure: {}", e.what());
        err_ << "Error: " << e.what() << std::endl;
        return 1;
    }
}

void App::print_summary(const Config& config, const WalkStats& stats, std::size_t entries) const {
    const auto& data = config.data();
    if (!data.ignore.empty() && data.show_ignore_list) {
        out_ << "\nIgnored:\n";
        for (const auto& rule : config.sorted_ignore_list()) {
            out_ << rule << '\n';
        }
    }

    out_ << fmt::format("\n{} entries written to {} ({} directories, {} files, {} unavailable)\n", entries,
                        config.output_path().string(), stats.directories, stats.files, stats.unavailable);
    if (stats.denied > 0 || stats.unreadable_directories > 0) {
        out_ << fmt::format("{} paths could not be inspected, {} directories could not be listed\n", stats.denied,
                            stats.unreadable_directories);
    }
    out_ << "\nCongrats!." << std::endl;
}

} // namespace permsnap
