#pragma once

#include "config.hpp"
#include "interpreter.hpp"
#include "matcher.hpp"
#include "transcript.hpp"

#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace litmus {

    struct file_result {
        std::string name{};
        std::size_t attempted{0U};
        std::size_t failed{0U};
        std::size_t skipped{0U};
        // Failure reports, already formatted.
        std::string report{};

        bool ok() const { return failed == 0U; }
    };

    class test_runner {
      public:
        explicit test_runner(startup_config config, std::ostream& progress = std::cout);

        // Prints the progress header and one status line per name; true when nothing failed.
        bool run(const std::vector<std::string>& tests, const std::vector<std::string>& skip = {});
        bool run_all(const std::vector<std::string>& skip = {});

        // Evaluates every example of `file` against a fresh namespace. Does not print.
        file_result run_file(const transcript_file& file) const;

        option_flags default_flags() const;

      private:
        bool run_test(std::string_view name);
        std::string padding(std::string_view name) const;

        startup_config config_;
        std::ostream& progress_;
    };

    // Evaluates `source` with the context output and diagnostics redirected into the returned
    // text. An uncaught error becomes its last line, `<kind>: <message>` with the kind unqualified.
    std::string capture_evaluation(std::string_view source, script::execution_context& ctx);

    std::string format_failure(const transcript_file& file, const example& ex, const match_result& match);

}  // namespace litmus
