#pragma once

#include "permsnap/cli.hpp"
#include "permsnap/config.hpp"
#include "permsnap/entry.hpp"

#include <iosfwd>

namespace permsnap {

class App {
public:
    App();
    App(std::ostream& out, std::ostream& err);

    int run(int argc, char** argv);

private:
    void print_summary(const Config& config, const WalkStats& stats, std::size_t entries) const;

    std::ostream& out_;
    std::ostream& err_;
};

} // namespace permsnap
