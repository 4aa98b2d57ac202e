#pragma once

#include "config.hpp"

#include <optional>
#include <ostream>

namespace dayinit::cli {

    // Resolves `cfg` from defaults, the settings file and argv; an engaged result is the exit code to return
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    int run(const startup_config& cfg, std::ostream& out);

}  // namespace dayinit::cli
