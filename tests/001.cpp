#include "utils.hpp"

namespace litmus::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: platform and capture scope parsing", "[001][config]") {
        platform_kind platform = platform_kind::gnu_linux;
        capture_scope scope = capture_scope::file;

        REQUIRE(try_parse_platform("LINUX"sv, platform));
        CHECK(platform == platform_kind::gnu_linux);
        REQUIRE(try_parse_platform("darwin"sv, platform));
        CHECK(platform == platform_kind::macos);
        REQUIRE(try_parse_platform("Windows"sv, platform));
        CHECK(platform == platform_kind::windows);
        CHECK_FALSE(try_parse_platform("beos"sv, platform));
        CHECK(platform == platform_kind::windows);

        REQUIRE(try_parse_capture_scope("example"sv, scope));
        CHECK(scope == capture_scope::example);
        REQUIRE(try_parse_capture_scope("FILE"sv, scope));
        CHECK(scope == capture_scope::file);
        CHECK_FALSE(try_parse_capture_scope("session"sv, scope));
    }

    TEST_CASE("001: enum string conversion", "[001][config]") {
        CHECK(to_string(platform_kind::gnu_linux) == "Linux"sv);
        CHECK(to_string(platform_kind::macos) == "macOS"sv);
        CHECK(to_string(platform_kind::windows) == "Windows"sv);

        CHECK(to_string(capture_scope::file) == "file"sv);
        CHECK(to_string(capture_scope::example) == "example"sv);

        CHECK(runs::to_string(runs::run_status::completed) == "completed"sv);
        runs::run_status status = runs::run_status::pending;
        REQUIRE(runs::try_parse_run_status("ERROR"sv, status));
        CHECK(status == runs::run_status::error);
        CHECK_FALSE(runs::try_parse_run_status("done"sv, status));
    }

    TEST_CASE("001: option flag names round trip through the parser", "[001][config][flags]") {
        constexpr option_flag all[] = {
                option_flag::ellipsis,
                option_flag::normalize_whitespace,
                option_flag::normalize_paths,
                option_flag::strip_u,
                option_flag::strip_l,
                option_flag::windows,
                option_flag::skip,
                option_flag::report_only_first_failure};
        for (auto flag : all) {
            option_flag parsed{};
            REQUIRE(try_parse_option_flag(to_string(flag), parsed));
            CHECK(parsed == flag);
        }

        option_flag parsed{};
        CHECK(try_parse_option_flag("normalize_paths"sv, parsed));
        CHECK(parsed == option_flag::normalize_paths);
        CHECK_FALSE(try_parse_option_flag("DONT_ACCEPT_BLANKLINE"sv, parsed));
    }

    TEST_CASE("001: option overrides layer over a base set", "[001][config][flags]") {
        auto base = option_flag::ellipsis | option_flag::normalize_whitespace;
        CHECK(base.has(option_flag::ellipsis));
        CHECK_FALSE(base.has(option_flag::skip));

        option_overrides overrides{};
        overrides.settings[option_flag::ellipsis] = false;
        overrides.settings[option_flag::strip_l] = true;

        auto applied = overrides.apply(base);
        CHECK_FALSE(applied.has(option_flag::ellipsis));
        CHECK(applied.has(option_flag::normalize_whitespace));
        CHECK(applied.has(option_flag::strip_l));
        CHECK(base.has(option_flag::ellipsis));
    }

    TEST_CASE("001: environment toggles report-first-failure", "[001][config][env]") {
        SECTION("1 enables") {
            detail::scoped_env_var toggle{std::string{report_first_failure_env}, "1"};
            startup_config cfg{};
            apply_environment(cfg);
            CHECK(cfg.report_first_failure);
        }
        SECTION("other values leave it off") {
            detail::scoped_env_var toggle{std::string{report_first_failure_env}, "yes"};
            startup_config cfg{};
            apply_environment(cfg);
            CHECK_FALSE(cfg.report_first_failure);
        }
        SECTION("unset leaves it off") {
            detail::scoped_env_var toggle{std::string{report_first_failure_env}, std::nullopt};
            startup_config cfg{};
            apply_environment(cfg);
            CHECK_FALSE(cfg.report_first_failure);
        }
    }

    TEST_CASE("001: user config path honors override variable", "[001][config][env]") {
        detail::scoped_env_var override_path{std::string{user_config_env}, "/tmp/litmus-alt/config.json"};
        CHECK(default_user_config_path() == std::filesystem::path{"/tmp/litmus-alt/config.json"});
    }

}  // namespace litmus::test
