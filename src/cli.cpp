#include "litmus/cli.hpp"

#include "editor.hpp"

#include "litmus/builtins.hpp"
#include "litmus/format.hpp"
#include "litmus/interpreter.hpp"
#include "litmus/runner.hpp"
#include "litmus/transcript.hpp"
#include "litmus/user_config.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace litmus::literals;

namespace litmus::cli { namespace detail {

    using namespace std::string_view_literals;
    namespace fs = std::filesystem;

    static constexpr auto version = "litmus 0.1.0"sv;

    struct repl_state {
        config_provider user_config;
        script::runtime_environment env;
        script::symbol_table names{};
        std::ostringstream idle{};
        script::execution_context ctx;

        explicit repl_state(const startup_config& cfg)
                : user_config{cfg.user_config_path},
                  env{cfg.search_path, user_config, cfg.samples_dir},
                  ctx{names, env, idle, idle} {
            script::install_builtins(names);
        }
    };

    static std::string join_paths(const std::vector<fs::path>& paths) {
        std::vector<std::string> parts{};
        for (const auto& p : paths) {
            parts.push_back(p.string());
        }
        return utils::join_with_separator(parts, ":"sv);
    }

    static void print_config(const startup_config& cfg, std::ostream& os) {
        os << ("  tests_dir={}\n"
               "  platform={}\n"
               "  captures={}\n"
               "  report_first_failure={}\n"
               "  search_path={}\n"
               "  user_config={}\n"
               "  samples_dir={}\n"
               "  history_file={}\n"_format(
                       cfg.tests_dir.string(),
                       to_string(cfg.platform),
                       to_string(cfg.captures),
                       cfg.report_first_failure,
                       join_paths(cfg.search_path),
                       cfg.user_config_path.string(),
                       cfg.samples_dir ? cfg.samples_dir->string() : std::string{"<none>"},
                       cfg.history_enabled ? cfg.history_file.string() : std::string{"<disabled>"}));
    }

    static void print_help(std::ostream& os) {
        static constexpr auto help_text = R"(commands:
  :help
  :names
  :reset
  :show config
  :quit
examples:
  x = 1 + 2
  x
  print(join_path("a", "b"))
  with Env({"NAME": "value"}) { print(getenv("NAME")) }
)";
        os << help_text;
    }

    static bool process_command(
            std::string_view line, const startup_config& cfg, repl_state& state, bool& should_quit) {
        auto cmd = utils::trim_view(line);
        if (cmd == ":quit"sv || cmd == ":q"sv) {
            should_quit = true;
            return true;
        }
        if (cmd == ":help"sv) {
            print_help(std::cout);
            return true;
        }
        if (cmd == ":show config"sv) {
            print_config(cfg, std::cout);
            return true;
        }
        if (cmd == ":names"sv) {
            auto builtins = script::builtin_names();
            for (const auto& name : state.names.names()) {
                if (!std::ranges::binary_search(builtins, name)) {
                    std::cout << name << '\n';
                }
            }
            return true;
        }
        if (cmd == ":reset"sv) {
            state.names = script::symbol_table{};
            script::install_builtins(state.names);
            std::cout << "namespace reset\n";
            return true;
        }
        if (cmd.starts_with(":"sv)) {
            std::cerr << "unknown command: " << cmd << '\n';
            return true;
        }
        return false;
    }

}}  // namespace litmus::cli::detail

namespace litmus::cli {

    int run_tests(const startup_config& cfg) {
        if (cfg.list_only) {
            for (const auto& name : all_tests(cfg.tests_dir)) {
                std::cout << name << '\n';
            }
            return 0;
        }

        if (cfg.verbose) {
            detail::print_config(cfg, std::cerr);
        }

        std::ostringstream buffered{};
        std::ostream& progress = cfg.quiet ? static_cast<std::ostream&>(buffered) : std::cout;
        test_runner runner{cfg, progress};

        auto ok = cfg.tests.empty() ? runner.run_all(cfg.skip) : runner.run(cfg.tests, cfg.skip);
        if (!ok && cfg.quiet) {
            std::cout << buffered.str();
        }
        return ok ? 0 : 1;
    }

    void run_repl(startup_config& cfg) {
        detail::repl_state state{cfg};
        line_editor editor{cfg};
        std::string pending_cell{};
        bool should_quit = false;

        std::cout << detail::version << " repl\n";
        std::cout << "type :help for commands\n";

        while (!should_quit) {
            std::string_view prompt = pending_cell.empty() ? ">>> "sv : "... "sv;
            auto next_line = editor.read_line(prompt);
            if (!next_line) {
                if (!pending_cell.empty()) {
                    std::cerr << "warning: discarding incomplete input at EOF\n";
                }
                std::cout << '\n';
                break;
            }
            auto line = std::move(*next_line);

            if (utils::trim_view(line).empty()) {
                if (!pending_cell.empty()) {
                    pending_cell.push_back('\n');
                }
                continue;
            }

            editor.record_history(line);

            if (pending_cell.empty() && detail::process_command(line, cfg, state, should_quit)) {
                continue;
            }

            if (!pending_cell.empty()) {
                pending_cell.push_back('\n');
            }
            pending_cell += line;

            if (!script::input_is_complete(pending_cell)) {
                continue;
            }

            std::cout << capture_evaluation(pending_cell, state.ctx) << std::flush;
            pending_cell.clear();
        }
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"litmus: literate transcript test runner"};

        bool show_version = false;
        std::string tests_dir_arg{cfg.tests_dir.string()};
        std::string platform_arg{std::string{to_string(cfg.platform)}};
        std::string captures_arg{std::string{to_string(cfg.captures)}};
        std::vector<std::string> search_path_arg{};
        std::string user_config_arg{cfg.user_config_path.string()};
        std::string samples_dir_arg{};
        std::string history_file_arg{cfg.history_file.string()};
        bool no_history = false;

        app.add_option("tests", cfg.tests, "Transcript names to run (default: all)");
        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--tests-dir", tests_dir_arg, "Directory holding <name>.md transcripts");
        app.add_option("--skip", cfg.skip, "Transcript name to report as skipped (repeatable)");
        app.add_option("--platform", platform_arg, "Platform: linux|macos|windows");
        app.add_option("--captures", captures_arg, "Capture scope: file|example");
        app.add_flag(
                "--report-first-failure",
                cfg.report_first_failure,
                "Only report the first failing example of each transcript");
        app.add_option("--search-path", search_path_arg, "Directory searched by include() (repeatable)");
        app.add_option("--user-config", user_config_arg, "User config JSON read by user_config()");
        app.add_option("--samples-dir", samples_dir_arg, "Root returned by samples_dir()");
        app.add_option("--history-file", history_file_arg, "Persistent REPL history path");
        app.add_flag("--no-history", no_history, "Disable persistent REPL history");
        app.add_flag("--list", cfg.list_only, "List transcript names and exit");
        app.add_flag("--repl", cfg.repl, "Start the interactive shell");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Only print progress when a transcript fails");
        app.add_flag("--verbose", cfg.verbose, "Print the resolved config before running");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!try_parse_platform(platform_arg, cfg.platform)) {
            std::cerr << "invalid --platform value: " << platform_arg << " (expected linux|macos|windows)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_capture_scope(captures_arg, cfg.captures)) {
            std::cerr << "invalid --captures value: " << captures_arg << " (expected file|example)\n";
            return std::optional<int>{2};
        }

        cfg.tests_dir = tests_dir_arg;
        cfg.user_config_path = user_config_arg;
        for (const auto& dir : search_path_arg) {
            cfg.search_path.emplace_back(dir);
        }
        if (auto samples = utils::trim_view(samples_dir_arg); !samples.empty()) {
            cfg.samples_dir = fs::path{samples};
        }
        cfg.history_file = history_file_arg;
        if (no_history) {
            cfg.history_enabled = false;
        }

        if (show_version) {
            std::cout << detail::version << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace litmus::cli
