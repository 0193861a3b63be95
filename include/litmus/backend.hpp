#pragma once

#include "runs.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace litmus::runs {

    inline constexpr auto no_warn_rundir_env = "NO_WARN_RUNDIR"sv;
    inline constexpr auto run_dir_env = "LITMUS_RUN_DIR"sv;
    inline constexpr auto manifest_filename = "MANIFEST"sv;
    inline constexpr auto publish_summary_filename = "runs.json"sv;

    // Abnormal exit of an operation; carries its captured output.
    class run_error : public error {
      public:
        run_error(std::filesystem::path dir, std::string output, int exit_code)
                : error{"litmus::runs::run_error", "operation exited with status " + std::to_string(exit_code)},
                  dir_{std::move(dir)},
                  output_{std::move(output)},
                  exit_code_{exit_code} {}

        const std::filesystem::path& dir() const { return dir_; }
        const std::string& output() const { return output_; }
        int exit_code() const { return exit_code_; }

      private:
        std::filesystem::path dir_{};
        std::string output_{};
        int exit_code_{};
    };

    struct run_outcome {
        std::filesystem::path dir{};
        std::string output{};
    };

    struct list_filter {
        std::vector<std::string> selectors{};
        bool marked_only{false};
        std::optional<run_status> status{};
    };

    using table_rows = std::vector<std::vector<std::string>>;

    // Executes and manages operation runs stored under one storage root.
    class operation_backend {
      public:
        virtual ~operation_backend() = default;

        virtual const std::filesystem::path& home() const = 0;

        virtual run_outcome run(run_request request) = 0;
        virtual std::vector<run_record> runs_list(const list_filter& filter) = 0;
        // Deletes the selected runs, or every run when `selectors` is empty.
        virtual std::vector<run_record> runs_delete(const std::vector<std::string>& selectors) = 0;
        virtual std::vector<run_record> mark(const std::vector<std::string>& selectors, bool clear) = 0;
        virtual std::vector<run_record> label(
                const std::vector<std::string>& selectors, std::optional<std::string> label) = 0;
        // Header row first: run, operation, status, then one column per flag name.
        virtual table_rows compare(const std::vector<std::string>& selectors) = 0;
        virtual std::vector<std::filesystem::path> publish(
                const std::vector<std::string>& selectors, const std::filesystem::path& dest) = 0;
        virtual std::filesystem::path package(
                const std::filesystem::path& source, const std::filesystem::path& dest) = 0;
    };

    // Runs operations as `/bin/sh -c` command lines on this machine.
    class local_backend final : public operation_backend {
      public:
        explicit local_backend(std::filesystem::path home);

        const std::filesystem::path& home() const override { return store_.home(); }
        const run_store& store() const { return store_; }

        run_outcome run(run_request request) override;
        std::vector<run_record> runs_list(const list_filter& filter) override;
        std::vector<run_record> runs_delete(const std::vector<std::string>& selectors) override;
        std::vector<run_record> mark(const std::vector<std::string>& selectors, bool clear) override;
        std::vector<run_record> label(
                const std::vector<std::string>& selectors, std::optional<std::string> label) override;
        table_rows compare(const std::vector<std::string>& selectors) override;
        std::vector<std::filesystem::path> publish(
                const std::vector<std::string>& selectors, const std::filesystem::path& dest) override;
        std::filesystem::path package(
                const std::filesystem::path& source, const std::filesystem::path& dest) override;

      private:
        run_store store_;
    };

    // POSIX single-quoting for one shell word.
    std::string shell_quote(std::string_view value);

    std::string format_flags(const std::map<std::string, std::string>& flags, std::string_view delim = " "sv);

}  // namespace litmus::runs
