#pragma once

#include "litmus/litmus.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/hash.hpp"
#include "../src/internal/paths.hpp"
#include "../src/internal/types.hpp"

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace litmus::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::steady_clock::now().time_since_epoch().count();
            path = fs::temp_directory_path() /
                   (std::string{prefix} + "_" + std::to_string(::getpid()) + "_" + std::to_string(now));
            fs::create_directories(path);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    struct scoped_env_var {
        std::string name{};
        std::optional<std::string> previous{};

        scoped_env_var(std::string key, std::optional<std::string> value) : name{std::move(key)} {
            if (auto* current = std::getenv(name.c_str()); current != nullptr) {
                previous = std::string{current};
            }
            if (value) {
                ::setenv(name.c_str(), value->c_str(), 1);
            }
            else {
                ::unsetenv(name.c_str());
            }
        }

        scoped_env_var(const scoped_env_var&) = delete;
        scoped_env_var& operator=(const scoped_env_var&) = delete;

        ~scoped_env_var() {
            if (previous) {
                ::setenv(name.c_str(), previous->c_str(), 1);
            }
            else {
                ::unsetenv(name.c_str());
            }
        }
    };

    inline std::optional<std::string> env_value(const char* name) {
        if (auto* v = std::getenv(name); v != nullptr) {
            return std::string{v};
        }
        return std::nullopt;
    }

    inline void write_text_file(const fs::path& path, std::string_view text) {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    // Fresh namespace seeded with builtins, writing into caller-owned streams.
    struct script_session {
        config_provider user_config;
        script::runtime_environment env;
        script::symbol_table names{};
        std::ostringstream out{};
        std::ostringstream err{};
        script::execution_context ctx;

        explicit script_session(
                fs::path user_config_path = fs::path{"/nonexistent/litmus/config.json"},
                std::vector<fs::path> search_path = {},
                std::optional<fs::path> samples_dir = std::nullopt)
                : user_config{std::move(user_config_path)},
                  env{std::move(search_path), user_config, std::move(samples_dir)},
                  ctx{names, env, out, err} {
            script::install_builtins(names);
        }

        // Output of one evaluation, errors rendered as a trailing line.
        std::string eval(std::string_view source) { return capture_evaluation(source, ctx); }

        std::string take_out() {
            auto text = out.str();
            out.str({});
            return text;
        }
    };

    inline startup_config make_config(const fs::path& tests_dir) {
        startup_config cfg{};
        cfg.tests_dir = tests_dir;
        cfg.platform = platform_kind::gnu_linux;
        cfg.user_config_path = tests_dir / "no-such-config.json";
        cfg.history_enabled = false;
        return cfg;
    }

}  // namespace litmus::test::detail
