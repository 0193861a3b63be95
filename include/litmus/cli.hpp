#pragma once

#include "config.hpp"

#include <optional>

namespace litmus::cli {

    // Fills `cfg`; returns an exit code when the process should stop (bad values, --version,
    // --print-config).
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    // Runs the selected (or all) transcripts; 0 when every one passed.
    int run_tests(const startup_config& cfg);

    void run_repl(startup_config& cfg);

}  // namespace litmus::cli
