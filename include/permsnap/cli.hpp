#pragma once

#include "permsnap/config.hpp"

#include <memory>
#include <optional>

namespace CLI {
class App;
}

namespace permsnap {

class Cli {
public:
    Cli();
    ~Cli();

    // Fills config. Returns an exit code when the run should stop here
    // (help, version, invalid arguments), std::nullopt to carry on.
    [[nodiscard]] std::optional<int> parse(int argc, char** argv, Config& config);

private:
    std::unique_ptr<CLI::App> app_;
};

} // namespace permsnap
