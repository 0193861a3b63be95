#pragma once

#include "backend.hpp"
#include "value.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace litmus {

    struct print_runs_options {
        bool flags{false};
        bool labels{false};
        bool status{false};
        // Directory the table is rendered from, relative to the project; operations of runs
        // started elsewhere are prefixed with their directory.
        std::optional<std::filesystem::path> cwd{};
    };

    // Drives operation runs for one project directory against one storage root.
    class project {
      public:
        // A missing `home` gets a fresh temporary storage root.
        explicit project(std::filesystem::path cwd, std::optional<std::filesystem::path> home = std::nullopt);

        const std::filesystem::path& cwd() const { return cwd_; }
        const std::filesystem::path& home() const { return backend_.home(); }
        runs::operation_backend& backend() { return backend_; }

        // Resolves the run directory once, runs with NO_WARN_RUNDIR=1 and returns the record
        // of that directory with the whitespace-stripped output. Throws runs::run_error.
        std::pair<runs::run_record, std::string> run_capture(runs::run_request request);

        // Prints the output; an abnormal exit prints the output followed by `<exit N>`.
        void run(runs::run_request request, std::ostream& out);
        void run_quiet(runs::run_request request);

        std::vector<runs::run_record> list_runs(const runs::list_filter& filter = {});
        void print_runs(
                const std::optional<std::vector<runs::run_record>>& selected,
                print_runs_options options,
                std::ostream& out);

        std::vector<runs::run_record> delete_runs(const std::vector<std::string>& selectors);
        std::vector<runs::run_record> mark(const std::vector<std::string>& selectors, bool clear = false);
        std::vector<runs::run_record> label(
                const std::vector<std::string>& selectors, std::optional<std::string> label);
        runs::table_rows compare(const std::vector<std::string>& selectors);
        std::vector<std::filesystem::path> publish(
                const std::vector<std::string>& selectors, const std::filesystem::path& dest);
        std::filesystem::path package(const std::filesystem::path& dest);

        // Files of a run relative to its directory. Metadata is hidden unless `all`;
        // `sourcecode` lists only the source snapshot.
        static std::vector<std::string> ls(const runs::run_record& run, bool all = false, bool sourcecode = false);
        static std::string cat(const runs::run_record& run, const std::filesystem::path& path);

      private:
        std::filesystem::path resolve_cwd(const std::filesystem::path& cwd) const;

        std::filesystem::path cwd_{};
        runs::local_backend backend_;
    };

    // Left-aligned columns separated by two spaces, no header.
    std::string format_table(const runs::table_rows& rows);

}  // namespace litmus

namespace litmus::script {

    // `Project(cwd, home=none)`
    value make_project(arguments& args, execution_context& ctx);

    value wrap_run(runs::run_record run);

}  // namespace litmus::script
