#include "litmus/backend.hpp"

#include "internal/hash.hpp"
#include "internal/paths.hpp"
#include "internal/process.hpp"
#include "internal/types.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <set>
#include <stdexcept>
#include <system_error>

using namespace litmus::literals;

namespace litmus::runs {

    namespace fs = std::filesystem;

    namespace detail {

        static constexpr auto shell_path = "/bin/sh"sv;

        static int64_t now_micros() {
            auto now = std::chrono::system_clock::now().time_since_epoch();
            return std::chrono::duration_cast<std::chrono::microseconds>(now).count();
        }

        static bool env_flag_set(std::string_view name) {
            auto* value = std::getenv(std::string{name}.c_str());
            return value != nullptr && std::string_view{value} == "1"sv;
        }

        static constexpr bool is_shell_safe(char c) {
            return utils::is_identifier_char(c) || c == '@' || c == '%' || c == '+' || c == '=' || c == ':' ||
                   c == ',' || c == '.' || c == '/' || c == '-';
        }

        static std::string build_command(const run_attrs& attrs) {
            std::string command{attrs.opspec};
            for (const auto& [name, value] : attrs.flags) {
                command += " --{}={}"_format(name, shell_quote(value));
            }
            return command;
        }

        // Removes everything a previous run produced except its metadata.
        static void clear_run_files(const fs::path& dir) {
            std::error_code ec{};
            for (const auto& entry : fs::directory_iterator(dir, ec)) {
                if (entry.path().filename() == meta_subdir) {
                    continue;
                }
                fs::remove_all(entry.path(), ec);
                if (ec) {
                    throw std::runtime_error("failed to clear {}"_format(entry.path().string()));
                }
            }
            fs::remove(meta_dir(dir) / output_filename, ec);
        }

        // Snapshot of the operation's working directory, minus the storage root and the run itself.
        static void copy_sourcecode(const fs::path& cwd, const fs::path& dir, const fs::path& home) {
            auto source_root = fs::absolute(cwd).lexically_normal();
            std::vector<fs::path> excluded{fs::absolute(home).lexically_normal(), fs::absolute(dir).lexically_normal()};
            internal::copy_visible_files(source_root, meta_dir(dir) / sourcecode_subdir, excluded);
        }

    }  // namespace detail

    std::string shell_quote(std::string_view value) {
        if (!value.empty() && std::ranges::all_of(value, detail::is_shell_safe)) {
            return std::string{value};
        }
        std::string out{"'"};
        for (auto c : value) {
            if (c == '\'') {
                out += "'\\''";
            }
            else {
                out.push_back(c);
            }
        }
        out.push_back('\'');
        return out;
    }

    std::string format_flags(const std::map<std::string, std::string>& flags, std::string_view delim) {
        std::vector<std::string> parts{};
        parts.reserve(flags.size());
        for (const auto& [name, value] : flags) {
            parts.push_back("{}={}"_format(name, value));
        }
        return utils::join_with_separator(parts, delim);
    }

    local_backend::local_backend(fs::path home) : store_{std::move(home)} {}

    run_outcome local_backend::run(run_request request) {
        auto explicit_dir = request.run_dir.has_value();
        auto dir = resolve_run_dir(store_, request);
        auto resuming = request.rerun.has_value() || request.restart.has_value();
        auto cwd = request.cwd.empty() ? fs::current_path() : request.cwd;

        std::error_code ec{};
        auto dir_existed = fs::exists(dir, ec) && !ec;

        run_attrs attrs{};
        if (resuming) {
            auto prior = read_attrs(dir);
            if (!prior) {
                throw resolve_error{"run directory {} has no recorded run"_format(dir.string())};
            }
            attrs = std::move(*prior);
            if (!request.opspec.empty()) {
                attrs.opspec = request.opspec;
            }
            for (const auto& [name, value] : request.flags) {
                attrs.flags.insert_or_assign(name, value);
            }
            if (request.rerun) {
                detail::clear_run_files(dir);
            }
        }
        else {
            if (request.opspec.empty()) {
                throw std::invalid_argument("no operation specified");
            }
            attrs.id = dir.filename().string();
            attrs.opspec = request.opspec;
            attrs.flags = request.flags;
        }
        if (request.label) {
            attrs.label = request.label;
        }
        attrs.cwd = cwd.string();
        attrs.started = detail::now_micros();
        attrs.stopped.reset();
        attrs.exit_status.reset();
        attrs.status = run_status::running;

        fs::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error("failed to create run dir: {}"_format(dir.string()));
        }
        write_attrs(dir, attrs);
        if (!resuming && !request.cwd.empty()) {
            detail::copy_sourcecode(cwd, dir, store_.home());
        }

        std::string output{};
        if (explicit_dir && dir_existed && !resuming && !detail::env_flag_set(no_warn_rundir_env)) {
            output += "WARNING: using existing run directory {}\n"_format(dir.string());
        }

        auto env = request.env;
        env.insert_or_assign(std::string{run_dir_env}, dir.string());

        auto command = detail::build_command(attrs);
        debug_log("running '", command, "' in ", cwd.string());
        auto result = internal::run_process({std::string{detail::shell_path}, "-c", command}, cwd, env);
        output += result.output;

        internal::write_text_file(meta_dir(dir) / output_filename, output);

        attrs.stopped = detail::now_micros();
        attrs.exit_status = result.exit_code;
        attrs.status = result.exit_code == 0 ? run_status::completed : run_status::error;
        write_attrs(dir, attrs);

        if (result.exit_code != 0) {
            throw run_error{dir, std::move(output), result.exit_code};
        }
        return run_outcome{dir, std::move(output)};
    }

    std::vector<run_record> local_backend::runs_list(const list_filter& filter) {
        std::vector<run_record> out{};
        for (auto& run : store_.select(filter.selectors)) {
            if (filter.marked_only && !run.attrs().marked) {
                continue;
            }
            if (filter.status && run.attrs().status != *filter.status) {
                continue;
            }
            out.push_back(std::move(run));
        }
        return out;
    }

    std::vector<run_record> local_backend::runs_delete(const std::vector<std::string>& selectors) {
        auto selected = store_.select(selectors);
        for (const auto& run : selected) {
            std::error_code ec{};
            fs::remove_all(run.dir(), ec);
            if (ec) {
                throw std::runtime_error("failed to delete run {}: {}"_format(run.id(), ec.message()));
            }
        }
        return selected;
    }

    std::vector<run_record> local_backend::mark(const std::vector<std::string>& selectors, bool clear) {
        std::vector<run_record> out{};
        for (const auto& run : store_.select(selectors)) {
            auto attrs = run.attrs();
            attrs.marked = !clear;
            write_attrs(run.dir(), attrs);
            out.emplace_back(run.dir(), std::move(attrs));
        }
        return out;
    }

    std::vector<run_record> local_backend::label(
            const std::vector<std::string>& selectors, std::optional<std::string> label) {
        std::vector<run_record> out{};
        for (const auto& run : store_.select(selectors)) {
            auto attrs = run.attrs();
            attrs.label = label;
            write_attrs(run.dir(), attrs);
            out.emplace_back(run.dir(), std::move(attrs));
        }
        return out;
    }

    table_rows local_backend::compare(const std::vector<std::string>& selectors) {
        auto selected = store_.select(selectors);

        std::set<std::string> flag_names{};
        for (const auto& run : selected) {
            for (const auto& [name, _] : run.attrs().flags) {
                flag_names.insert(name);
            }
        }

        table_rows rows{};
        std::vector<std::string> header{"run", "operation", "status"};
        header.insert(header.end(), flag_names.begin(), flag_names.end());
        rows.push_back(std::move(header));

        for (const auto& run : selected) {
            std::vector<std::string> row{run.short_id(), run.attrs().opspec, std::string{to_string(run.attrs().status)}};
            for (const auto& name : flag_names) {
                auto it = run.attrs().flags.find(name);
                row.push_back(it == run.attrs().flags.end() ? std::string{} : it->second);
            }
            rows.push_back(std::move(row));
        }
        return rows;
    }

    std::vector<fs::path> local_backend::publish(const std::vector<std::string>& selectors, const fs::path& dest) {
        std::error_code ec{};
        fs::create_directories(dest, ec);
        if (ec) {
            throw std::runtime_error("failed to create publish dir: {}"_format(dest.string()));
        }

        std::vector<fs::path> published{};
        internal::publish_summary summary{};
        for (const auto& run : store_.select(selectors)) {
            auto target = dest / run.id();
            fs::copy(run.dir(), target, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
            if (ec) {
                throw std::runtime_error("failed to publish run {}: {}"_format(run.id(), ec.message()));
            }
            published.push_back(target);
            summary.runs.push_back(internal::published_run{
                    run.id(),
                    run.attrs().opspec,
                    std::string{to_string(run.attrs().status)},
                    run.attrs().label,
                    run.attrs().flags});
        }
        internal::write_json_file(summary, dest / publish_summary_filename);
        return published;
    }

    fs::path local_backend::package(const fs::path& source, const fs::path& dest) {
        auto source_root = fs::absolute(source).lexically_normal();
        auto dest_root = fs::absolute(dest).lexically_normal();

        std::error_code ec{};
        fs::create_directories(dest_root, ec);
        if (ec) {
            throw std::runtime_error("failed to create package dir: {}"_format(dest_root.string()));
        }

        std::vector<std::pair<std::string, std::string>> manifest{};
        for (const auto& relative : internal::copy_visible_files(source_root, dest_root, {dest_root})) {
            manifest.emplace_back(relative.generic_string(), internal::sha256_file(dest_root / relative));
        }

        std::ranges::sort(manifest);
        std::string text{};
        for (const auto& [path, digest] : manifest) {
            text += "{}  {}\n"_format(digest, path);
        }
        internal::write_text_file(dest_root / manifest_filename, text);
        return dest_root;
    }

}  // namespace litmus::runs
