#include "litmus/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        litmus::startup_config cfg{};
        litmus::apply_environment(cfg);
        if (auto cli_result = litmus::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        if (cfg.repl) {
            litmus::cli::run_repl(cfg);
            return 0;
        }
        return litmus::cli::run_tests(cfg);
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
