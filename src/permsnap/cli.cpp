#include "permsnap/cli.hpp"

#include "permsnap/logger.hpp"
#include "permsnap/version.hpp"

#include <CLI/CLI.hpp>

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace permsnap {

namespace {
struct CliState {
    std::string root;
    std::string os;
    std::vector<std::string> ignore;
    std::string output;
    std::vector<std::string> byproduct_suffixes;
    std::string log_level{"warn"};
    bool no_show_ignore_list{false};
    bool no_dereference{false};
    bool include_root{false};
};

const std::map<std::string, Logger::Level, std::less<>>& log_level_table() {
    static const std::map<std::string, Logger::Level, std::less<>> table{
        {"error", Logger::Level::Error},
        {"warn", Logger::Level::Warning},
        {"warning", Logger::Level::Warning},
        {"info", Logger::Level::Info},
        {"debug", Logger::Level::Debug},
        {"trace", Logger::Level::Trace},
    };
    return table;
}

std::vector<std::string> log_level_names() {
    std::vector<std::string> names;
    for (const auto& [name, level] : log_level_table()) {
        names.push_back(name);
    }
    return names;
}
} // namespace

Cli::Cli()
    : app_(std::make_unique<CLI::App>("Snapshot ownership and permissions of an installed tree")) {}

Cli::~Cli() = default;

std::optional<int> Cli::parse(int argc, char** argv, Config& config) {
    CliState state{};
    app_ = std::make_unique<CLI::App>("Snapshot ownership and permissions of an installed tree", "permsnap");
    app_->set_version_flag("-V,--version", std::string{Version::String()});

    app_->add_option("-p,--path", state.root, "Root directory to snapshot")
        ->type_name("PATH")
        ->required();
    app_->add_option("-o,--os", state.os, "Operating system or host distribution")
        ->type_name("OS")
        ->required()
        ->check(CLI::IsMember(Config::supported_operating_systems()));
    app_->add_option("-i,--ignore", state.ignore, "Paths to ignore, comma separated: /var/ossec,/home")
        ->type_name("LIST")
        ->delimiter(',');
    app_->add_flag("-n,--no_show_ignore_list", state.no_show_ignore_list, "Do not print the ignore list");
    app_->add_option("--output", state.output, "Output file (default: <os>_files.json)")->type_name("FILE");
    app_->add_flag("--no-dereference", state.no_dereference, "Inspect symbolic links themselves, not their targets");
    app_->add_flag("--include-root", state.include_root, "Record the root directory itself");
    app_->add_option("--byproduct-suffix", state.byproduct_suffixes,
        "File name suffix to skip as a generated byproduct (repeatable, default: .pyc)")
        ->type_name("SUFFIX");
    app_->add_option("-v,--log-level", state.log_level, "Set log verbosity")
        ->type_name("LEVEL")
        ->default_str("warn")
        ->check(CLI::IsMember(log_level_names()));

    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    auto& data = config.data();
    data.root = std::move(state.root);
    data.os = std::move(state.os);
    data.ignore = std::move(state.ignore);
    if (!state.output.empty()) {
        data.output = std::move(state.output);
    }
    if (!state.byproduct_suffixes.empty()) {
        data.byproduct_suffixes = std::move(state.byproduct_suffixes);
    }
    data.show_ignore_list = !state.no_show_ignore_list;
    data.dereference = !state.no_dereference;
    data.include_root = state.include_root;
    data.log_level = log_level_table().find(state.log_level)->second;

    Logger::instance().set_level(data.log_level);
    return std::nullopt;
}

} // namespace permsnap
