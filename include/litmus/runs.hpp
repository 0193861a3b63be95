#pragma once

#include "error.hpp"
#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace litmus::runs {

    using namespace std::string_view_literals;

    inline constexpr auto runs_subdir = "runs"sv;
    inline constexpr auto meta_subdir = ".litmus"sv;
    inline constexpr auto attrs_filename = "attrs.json"sv;
    inline constexpr auto output_filename = "output"sv;
    inline constexpr auto sourcecode_subdir = "sourcecode"sv;
    inline constexpr std::size_t short_id_length = 8U;

    enum class run_status : uint8_t { pending, running, completed, error };

    inline constexpr std::string_view to_string(run_status status) {
        switch (status) {
            case run_status::pending:
                return "pending"sv;
            case run_status::running:
                return "running"sv;
            case run_status::completed:
                return "completed"sv;
            case run_status::error:
                return "error"sv;
        }
        return "pending"sv;
    }

    inline constexpr bool try_parse_run_status(std::string_view text, run_status& out) {
        constexpr run_status all[] = {
                run_status::pending, run_status::running, run_status::completed, run_status::error};
        for (auto status : all) {
            if (utils::str_case_eq(text, to_string(status))) {
                out = status;
                return true;
            }
        }
        return false;
    }

    struct run_attrs {
        int schema_version{1};
        std::string id{};
        std::string opspec{};
        std::map<std::string, std::string> flags{};
        std::string cwd{};
        // microseconds since the epoch
        int64_t started{};
        std::optional<int64_t> stopped{};
        std::optional<int> exit_status{};
        run_status status{run_status::pending};
        std::optional<std::string> label{};
        bool marked{false};
    };

    class resolve_error : public error {
      public:
        explicit resolve_error(std::string message) : error{"litmus::runs::resolve_error", std::move(message)} {}
    };

    class run_record {
      public:
        run_record(std::filesystem::path dir, run_attrs attrs);

        // Loads the metadata stored under `dir`; a directory without metadata yields
        // attributes derived from its name.
        static run_record from_dir(const std::filesystem::path& dir);

        const std::string& id() const { return attrs_.id; }
        std::string short_id() const { return attrs_.id.substr(0U, short_id_length); }
        const std::filesystem::path& dir() const { return dir_; }
        const run_attrs& attrs() const { return attrs_; }

      private:
        std::filesystem::path dir_{};
        run_attrs attrs_{};
    };

    std::filesystem::path meta_dir(const std::filesystem::path& run_dir);
    std::optional<run_attrs> read_attrs(const std::filesystem::path& run_dir);
    void write_attrs(const std::filesystem::path& run_dir, const run_attrs& attrs);
    std::string read_output(const std::filesystem::path& run_dir);

    // 32 lowercase hex characters; ids minted later sort after ids minted earlier.
    std::string mkid();

    // Creates the storage root layout under `home` and returns `home`.
    std::filesystem::path init_home(const std::filesystem::path& home);
    std::filesystem::path mkdtemp(std::string_view prefix = "litmus-test-"sv);
    std::filesystem::path mktemp_home();

    class run_store {
      public:
        explicit run_store(std::filesystem::path home);

        const std::filesystem::path& home() const { return home_; }
        std::filesystem::path runs_dir() const;
        std::filesystem::path run_dir(std::string_view id) const;

        // Newest first.
        std::vector<run_record> runs() const;

        // Operation name (marked, else latest), then 1-based index, then unique id prefix.
        run_record lookup(std::string_view selector) const;

        // Distinct runs for `selectors`, in selector order; every run when empty.
        std::vector<run_record> select(const std::vector<std::string>& selectors) const;

      private:
        std::filesystem::path home_{};
    };

    struct run_request {
        std::string opspec{};
        std::map<std::string, std::string> flags{};
        std::optional<std::filesystem::path> run_dir{};
        std::optional<std::string> rerun{};
        std::optional<std::string> restart{};
        std::optional<std::string> label{};
        std::map<std::string, std::string> env{};
        // Working directory of the operation; when set, new runs snapshot its visible files
        // into `.litmus/sourcecode`. Empty means the process working directory.
        std::filesystem::path cwd{};
    };

    // Explicit directory, else the run selected by rerun/restart, else a freshly minted id
    // whose directory is stored back into `request.run_dir` but not created.
    std::filesystem::path resolve_run_dir(const run_store& store, run_request& request);

}  // namespace litmus::runs
