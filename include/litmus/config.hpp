#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace litmus {

    using namespace std::string_view_literals;

    /*
     * Litmus Startup Config Options
     *
     * Selection
     * - tests_dir: Directory holding `<name>.md` transcript files.
     * - tests: Transcript names to run; empty runs every discovered transcript.
     * - skip: Transcript names reported as skipped without being read.
     * - list_only: Print discovered transcript names and exit.
     *
     * Matching
     * - platform: Platform used for head directives and the example platform gate.
     * - captures: Lifetime of `{{name}}` bindings (per file or per example).
     * - report_first_failure: Only report the first mismatch of each file; seeded from
     *   REPORT_ONLY_FIRST_FAILURE=1 at process start.
     * - name_width: Column width used to align the per-file status.
     *
     * Runtime environment seen by transcripts
     * - search_path: Ordered directories searched by `include(name)`.
     * - user_config_path: On-disk JSON source read by `user_config()`.
     * - samples_dir: Root returned by `samples_dir()` / `sample(...)`.
     *
     * Shell and output
     * - history_file / history_enabled: Persistent history of the interactive shell.
     * - repl: Start the interactive shell instead of running transcripts.
     * - quiet/verbose: Coarse output verbosity knobs.
     * - print_config: Print resolved startup config and exit.
     */

    enum class platform_kind : uint8_t { gnu_linux, macos, windows };
    enum class capture_scope : uint8_t { file, example };

    inline constexpr std::string_view to_string(platform_kind platform) {
        switch (platform) {
            case platform_kind::gnu_linux:
                return "Linux"sv;
            case platform_kind::macos:
                return "macOS"sv;
            case platform_kind::windows:
                return "Windows"sv;
        }
        return "Linux"sv;
    }

    inline constexpr bool try_parse_platform(std::string_view text, platform_kind& out) {
        if (utils::str_case_eq(text, "linux"sv)) {
            out = platform_kind::gnu_linux;
            return true;
        }
        if (utils::str_case_eq(text, "macos"sv) || utils::str_case_eq(text, "darwin"sv)) {
            out = platform_kind::macos;
            return true;
        }
        if (utils::str_case_eq(text, "windows"sv)) {
            out = platform_kind::windows;
            return true;
        }
        return false;
    }

    inline constexpr platform_kind current_platform() {
#if LITMUS_PLATFORM_WINDOWS
        return platform_kind::windows;
#elif LITMUS_PLATFORM_MACOS
        return platform_kind::macos;
#else
        return platform_kind::gnu_linux;
#endif
    }

    inline constexpr std::string_view to_string(capture_scope scope) {
        switch (scope) {
            case capture_scope::file:
                return "file"sv;
            case capture_scope::example:
                return "example"sv;
        }
        return "file"sv;
    }

    inline constexpr bool try_parse_capture_scope(std::string_view text, capture_scope& out) {
        if (utils::str_case_eq(text, "file"sv)) {
            out = capture_scope::file;
            return true;
        }
        if (utils::str_case_eq(text, "example"sv)) {
            out = capture_scope::example;
            return true;
        }
        return false;
    }

    inline constexpr auto report_first_failure_env = "REPORT_ONLY_FIRST_FAILURE"sv;
    inline constexpr auto user_config_env = "LITMUS_USER_CONFIG"sv;

    std::filesystem::path default_user_config_path();

    struct startup_config {
        std::filesystem::path tests_dir{"tests"};
        std::vector<std::string> tests{};
        std::vector<std::string> skip{};
        bool list_only{false};

        platform_kind platform{current_platform()};
        capture_scope captures{capture_scope::file};
        bool report_first_failure{false};
        std::size_t name_width{27U};

        std::vector<std::filesystem::path> search_path{};
        std::filesystem::path user_config_path{default_user_config_path()};
        std::optional<std::filesystem::path> samples_dir{};

        std::filesystem::path history_file{".litmus/history"};
        bool history_enabled{true};
        bool repl{false};
        bool quiet{false};
        bool verbose{false};
        bool print_config{false};
    };

    // Applies process environment toggles (REPORT_ONLY_FIRST_FAILURE) to `cfg`.
    void apply_environment(startup_config& cfg);

}  // namespace litmus
