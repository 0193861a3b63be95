#include "utils.hpp"

#include "litmus/cli.hpp"

#include <vector>

namespace litmus::test {

    namespace detail {
        std::vector<char*> to_argv(std::vector<std::string>& args) {
            std::vector<char*> argv{};
            argv.reserve(args.size());
            for (auto& arg : args) {
                argv.push_back(arg.data());
            }
            return argv;
        }
    }  // namespace detail

    TEST_CASE("002: parse_cli accepts startup options", "[002][cli]") {
        startup_config cfg{};
        std::vector<std::string> args{
                "litmus",
                "basics",
                "runs",
                "--tests-dir",
                "/tmp/litmus_tests/transcripts",
                "--skip",
                "slow",
                "--platform",
                "macos",
                "--captures",
                "example",
                "--report-first-failure",
                "--search-path",
                "/tmp/litmus_tests/scripts",
                "--search-path",
                "/tmp/litmus_tests/more",
                "--user-config",
                "/tmp/litmus_tests/config.json",
                "--samples-dir",
                "/tmp/litmus_tests/samples",
                "--history-file",
                "/tmp/litmus_tests/history.txt"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK(cfg.tests == std::vector<std::string>{"basics", "runs"});
        CHECK(cfg.tests_dir == "/tmp/litmus_tests/transcripts");
        CHECK(cfg.skip == std::vector<std::string>{"slow"});
        CHECK(cfg.platform == platform_kind::macos);
        CHECK(cfg.captures == capture_scope::example);
        CHECK(cfg.report_first_failure);
        REQUIRE(cfg.search_path.size() == 2U);
        CHECK(cfg.search_path[0] == "/tmp/litmus_tests/scripts");
        CHECK(cfg.search_path[1] == "/tmp/litmus_tests/more");
        CHECK(cfg.user_config_path == "/tmp/litmus_tests/config.json");
        REQUIRE(cfg.samples_dir);
        CHECK(*cfg.samples_dir == "/tmp/litmus_tests/samples");
        CHECK(cfg.history_file == "/tmp/litmus_tests/history.txt");
        CHECK(cfg.history_enabled);
    }

    TEST_CASE("002: parse_cli rejects invalid startup combos", "[002][cli]") {
        SECTION("invalid platform is rejected") {
            startup_config cfg{};
            std::vector<std::string> args{"litmus", "--platform", "plan9"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("invalid capture scope is rejected") {
            startup_config cfg{};
            std::vector<std::string> args{"litmus", "--captures", "forever"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("quiet and verbose cannot be combined") {
            startup_config cfg{};
            std::vector<std::string> args{"litmus", "--quiet", "--verbose"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }
    }

    TEST_CASE("002: parse_cli handles one-shot exits", "[002][cli]") {
        SECTION("version") {
            startup_config cfg{};
            std::vector<std::string> args{"litmus", "--version"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 0);
        }

        SECTION("print config") {
            startup_config cfg{};
            std::vector<std::string> args{"litmus", "--print-config", "--no-history"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 0);
        }
    }

    TEST_CASE("002: parse_cli handles history and mode toggles", "[002][cli]") {
        startup_config cfg{};
        std::vector<std::string> args{"litmus", "--no-history", "--repl", "--list"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK_FALSE(cfg.history_enabled);
        CHECK(cfg.repl);
        CHECK(cfg.list_only);
        CHECK(cfg.tests.empty());
        CHECK_FALSE(cfg.samples_dir);
    }

    TEST_CASE("002: run_tests exit status follows transcript results", "[002][cli][run]") {
        detail::temp_dir dir{"litmus_cli_run"};
        detail::write_text_file(dir.path / "good.md", ">>> 1 + 1\n2\n");
        detail::write_text_file(dir.path / "bad.md", ">>> 1 + 1\n3\n");

        auto cfg = detail::make_config(dir.path);
        cfg.quiet = true;

        cfg.tests = {"good"};
        CHECK(cli::run_tests(cfg) == 0);

        cfg.tests = {"good", "bad"};
        CHECK(cli::run_tests(cfg) == 1);

        cfg.skip = {"bad"};
        CHECK(cli::run_tests(cfg) == 0);
    }

}  // namespace litmus::test
