#include "litmus/harness.hpp"

#include "internal/paths.hpp"
#include "internal/types.hpp"
#include "litmus/format.hpp"
#include "litmus/guards.hpp"
#include "litmus/interpreter.hpp"

#include <algorithm>
#include <initializer_list>

using namespace litmus::literals;

namespace litmus {

    namespace fs = std::filesystem;

    project::project(fs::path cwd, std::optional<fs::path> home)
            : cwd_{fs::absolute(cwd).lexically_normal()}, backend_{home ? *home : runs::mktemp_home()} {
        runs::init_home(backend_.home());
    }

    fs::path project::resolve_cwd(const fs::path& cwd) const {
        if (cwd.empty()) {
            return cwd_;
        }
        return cwd.is_absolute() ? cwd : (cwd_ / cwd).lexically_normal();
    }

    std::pair<runs::run_record, std::string> project::run_capture(runs::run_request request) {
        request.cwd = resolve_cwd(request.cwd);
        auto dir = runs::resolve_run_dir(backend_.store(), request);
        request.run_dir = dir;

        scoped_env quiet{env_overlay{{std::string{runs::no_warn_rundir_env}, "1"}}};
        quiet.enter();
        auto outcome = backend_.run(std::move(request));
        quiet.exit();

        return {runs::run_record::from_dir(dir), std::string{utils::trim_view(outcome.output)}};
    }

    void project::run(runs::run_request request, std::ostream& out) {
        try {
            auto [record, output] = run_capture(std::move(request));
            out << output << '\n';
        }
        catch (const runs::run_error& e) {
            out << utils::trim_view(e.output()) << "\n<exit " << e.exit_code() << ">\n";
        }
    }

    void project::run_quiet(runs::run_request request) {
        request.cwd = resolve_cwd(request.cwd);
        scoped_env quiet{env_overlay{{std::string{runs::no_warn_rundir_env}, "1"}}};
        quiet.enter();
        backend_.run(std::move(request));
    }

    namespace detail {

        static std::string describe_operation(const runs::run_attrs& attrs) {
            if (attrs.cwd.empty()) {
                return attrs.opspec;
            }
            std::error_code ec{};
            auto here = fs::weakly_canonical(fs::current_path(), ec);
            auto origin = fs::weakly_canonical(fs::path{attrs.cwd}, ec);
            if (ec) {
                return attrs.opspec;
            }
            auto rel = origin.lexically_relative(here);
            if (rel.empty() || rel == ".") {
                return attrs.opspec;
            }
            return "{}:{}"_format(rel.string(), attrs.opspec);
        }

    }  // namespace detail

    std::vector<runs::run_record> project::list_runs(const runs::list_filter& filter) {
        return backend_.runs_list(filter);
    }

    void project::print_runs(
            const std::optional<std::vector<runs::run_record>>& selected, print_runs_options options, std::ostream& out) {
        auto listed = selected ? *selected : list_runs();

        scoped_cwd from{options.cwd ? resolve_cwd(*options.cwd) : cwd_};
        from.enter();

        runs::table_rows rows{};
        for (const auto& run : listed) {
            const auto& attrs = run.attrs();
            std::vector<std::string> row{detail::describe_operation(attrs)};
            if (options.flags) {
                row.push_back(runs::format_flags(attrs.flags));
            }
            if (options.labels) {
                row.push_back(attrs.label.value_or(""));
            }
            if (options.status) {
                row.emplace_back(runs::to_string(attrs.status));
            }
            rows.push_back(std::move(row));
        }
        out << format_table(rows);
    }

    std::vector<runs::run_record> project::delete_runs(const std::vector<std::string>& selectors) {
        return backend_.runs_delete(selectors);
    }

    std::vector<runs::run_record> project::mark(const std::vector<std::string>& selectors, bool clear) {
        return backend_.mark(selectors, clear);
    }

    std::vector<runs::run_record> project::label(
            const std::vector<std::string>& selectors, std::optional<std::string> label) {
        return backend_.label(selectors, std::move(label));
    }

    runs::table_rows project::compare(const std::vector<std::string>& selectors) {
        return backend_.compare(selectors);
    }

    std::vector<fs::path> project::publish(const std::vector<std::string>& selectors, const fs::path& dest) {
        return backend_.publish(selectors, resolve_cwd(dest));
    }

    fs::path project::package(const fs::path& dest) {
        return backend_.package(cwd_, resolve_cwd(dest));
    }

    std::vector<std::string> project::ls(const runs::run_record& run, bool all, bool sourcecode) {
        auto meta_prefix = std::string{runs::meta_subdir};
        auto sourcecode_prefix = "{}/{}/"_format(runs::meta_subdir, runs::sourcecode_subdir);

        std::vector<std::string> out{};
        for (auto& path : internal::find_relative(run.dir())) {
            bool keep = all || (sourcecode ? path.starts_with(sourcecode_prefix) : !path.starts_with(meta_prefix));
            if (keep) {
                out.push_back(std::move(path));
            }
        }
        return out;
    }

    std::string project::cat(const runs::run_record& run, const fs::path& path) {
        return internal::read_text_file(run.dir() / path);
    }

    std::string format_table(const runs::table_rows& rows) {
        std::vector<std::size_t> widths{};
        for (const auto& row : rows) {
            widths.resize(std::max(widths.size(), row.size()), 0U);
            for (std::size_t i = 0U; i < row.size(); ++i) {
                widths[i] = std::max(widths[i], row[i].size());
            }
        }

        std::string out{};
        for (const auto& row : rows) {
            std::string line{};
            for (std::size_t i = 0U; i < row.size(); ++i) {
                if (i > 0U) {
                    line += "  ";
                }
                line += row[i];
                if (i + 1U < row.size()) {
                    line.append(widths[i] - row[i].size(), ' ');
                }
            }
            out += utils::trim_view(line);
            out.push_back('\n');
        }
        return out;
    }

}  // namespace litmus

namespace litmus::script {

    namespace fs = std::filesystem;

    namespace detail {

        class run_object final : public object {
          public:
            explicit run_object(runs::run_record run) : run_{std::move(run)} {}

            std::string_view type_name() const override { return "run"sv; }

            std::optional<value> get_attr(std::string_view name) override {
                const auto& attrs = run_.attrs();
                if (name == "id") {
                    return run_.id();
                }
                if (name == "short_id") {
                    return run_.short_id();
                }
                if (name == "dir" || name == "path") {
                    return run_.dir().string();
                }
                if (name == "opspec") {
                    return attrs.opspec;
                }
                if (name == "status") {
                    return runs::to_string(attrs.status);
                }
                if (name == "label") {
                    return attrs.label ? value{*attrs.label} : value{};
                }
                if (name == "marked") {
                    return attrs.marked;
                }
                if (name == "exit_status") {
                    return attrs.exit_status ? value{*attrs.exit_status} : value{};
                }
                if (name == "cwd") {
                    return attrs.cwd;
                }
                if (name == "started") {
                    return attrs.started;
                }
                if (name == "stopped") {
                    return attrs.stopped ? value{*attrs.stopped} : value{};
                }
                if (name == "flags") {
                    std::map<std::string, value> flags{};
                    for (const auto& [key, v] : attrs.flags) {
                        flags.emplace(key, v);
                    }
                    return value::map(std::move(flags));
                }
                return std::nullopt;
            }

            std::optional<value> call_method(std::string_view name, arguments& args, execution_context&) override {
                if (name == "get") {
                    auto key = args.require(0U, "name", "get").as_string();
                    if (auto attr = get_attr(key)) {
                        return *attr;
                    }
                    return args.get(1U, "default").value_or(value{});
                }
                return std::nullopt;
            }

            std::string repr() const override { return "<run {}>"_format(run_.short_id()); }

            const runs::run_record& record() const { return run_; }

          private:
            runs::run_record run_;
        };

        static void expect_keywords(
                const arguments& args, std::initializer_list<std::string_view> allowed, std::string_view fn) {
            for (const auto& [key, _] : args.keywords) {
                if (std::ranges::find(allowed, std::string_view{key}) == allowed.end()) {
                    throw script_error{errors::type_error, "{}() got an unexpected keyword argument '{}'"_format(fn, key)};
                }
            }
        }

        static void append_selectors(const value& v, std::vector<std::string>& out) {
            if (v.is_none()) {
                return;
            }
            if (v.is_list()) {
                for (const auto& item : v.as_list()) {
                    append_selectors(item, out);
                }
                return;
            }
            if (auto run = v.object_as<run_object>()) {
                out.push_back(run->record().id());
                return;
            }
            if (v.is_int()) {
                out.push_back(std::to_string(v.as_int()));
                return;
            }
            out.push_back(v.as_string());
        }

        static std::vector<std::string> selectors_of(const std::optional<value>& v) {
            std::vector<std::string> out{};
            if (v) {
                append_selectors(*v, out);
            }
            return out;
        }

        static std::optional<std::string> single_selector(const std::optional<value>& v, std::string_view what) {
            auto selectors = selectors_of(v);
            if (selectors.empty()) {
                return std::nullopt;
            }
            if (selectors.size() > 1U) {
                throw script_error{errors::value_error, "{} takes a single run"_format(what)};
            }
            return selectors.front();
        }

        static const runs::run_record& run_of(const value& v, std::string_view fn) {
            auto run = v.object_as<run_object>();
            if (!run) {
                throw script_error{errors::type_error, "{}() expected a run, got {}"_format(fn, v.type_name())};
            }
            return run->record();
        }

        static std::map<std::string, std::string> string_map(const std::optional<value>& v) {
            std::map<std::string, std::string> out{};
            if (!v || v->is_none()) {
                return out;
            }
            for (const auto& [key, item] : v->as_map()) {
                out.emplace(key, str(item));
            }
            return out;
        }

        static std::optional<std::string> optional_string(const std::optional<value>& v) {
            if (!v || v->is_none()) {
                return std::nullopt;
            }
            return str(*v);
        }

        static bool flag(const arguments& args, std::size_t index, std::string_view name) {
            auto v = args.get(index, name);
            return v && v->truthy();
        }

        static runs::run_request request_of(const arguments& args, std::string_view fn) {
            expect_keywords(args, {"opspec", "flags", "run_dir", "rerun", "restart", "label", "env", "cwd"}, fn);
            args.expect_at_most(1U, fn);

            runs::run_request request{};
            if (auto opspec = optional_string(args.get(0U, "opspec"))) {
                request.opspec = *opspec;
            }
            request.flags = string_map(args.keyword("flags"));
            if (auto dir = optional_string(args.keyword("run_dir"))) {
                request.run_dir = fs::path{*dir};
            }
            request.rerun = single_selector(args.keyword("rerun"), "rerun");
            request.restart = single_selector(args.keyword("restart"), "restart");
            request.label = optional_string(args.keyword("label"));
            request.env = string_map(args.keyword("env"));
            if (auto cwd = optional_string(args.keyword("cwd"))) {
                request.cwd = *cwd;
            }
            return request;
        }

        static value runs_value(const std::vector<runs::run_record>& selected) {
            std::vector<value> out{};
            out.reserve(selected.size());
            for (const auto& run : selected) {
                out.push_back(wrap_run(run));
            }
            return value::list(std::move(out));
        }

        class project_object final : public object {
          public:
            explicit project_object(fs::path cwd, std::optional<fs::path> home) : project_{std::move(cwd), std::move(home)} {}

            std::string_view type_name() const override { return "Project"sv; }

            std::optional<value> get_attr(std::string_view name) override {
                if (name == "cwd") {
                    return project_.cwd().string();
                }
                if (name == "home") {
                    return project_.home().string();
                }
                return std::nullopt;
            }

            std::optional<value> call_method(std::string_view name, arguments& args, execution_context& ctx) override {
                if (name == "run_capture") {
                    auto [run, output] = project_.run_capture(request_of(args, name));
                    return value::list({wrap_run(std::move(run)), value{std::move(output)}});
                }
                if (name == "run") {
                    ctx.out().flush();
                    project_.run(request_of(args, name), ctx.out());
                    return none;
                }
                if (name == "run_quiet") {
                    project_.run_quiet(request_of(args, name));
                    return none;
                }
                if (name == "list_runs") {
                    expect_keywords(args, {"runs", "marked", "status"}, name);
                    runs::list_filter filter{};
                    filter.selectors = selectors_of(args.get(0U, "runs"));
                    filter.marked_only = flag(args, 1U, "marked");
                    if (auto status = optional_string(args.get(2U, "status"))) {
                        runs::run_status parsed{};
                        if (!runs::try_parse_run_status(*status, parsed)) {
                            throw script_error{errors::value_error, "invalid run status '{}'"_format(*status)};
                        }
                        filter.status = parsed;
                    }
                    return runs_value(project_.list_runs(filter));
                }
                if (name == "print_runs") {
                    expect_keywords(args, {"runs", "flags", "labels", "status", "cwd"}, name);
                    std::optional<std::vector<runs::run_record>> selected{};
                    if (auto listed = args.get(0U, "runs"); listed && !listed->is_none()) {
                        selected.emplace();
                        for (const auto& item : listed->as_list()) {
                            selected->push_back(run_of(item, name));
                        }
                    }
                    print_runs_options options{flag(args, 1U, "flags"), flag(args, 2U, "labels"), flag(args, 3U, "status")};
                    if (auto dir = optional_string(args.get(4U, "cwd"))) {
                        options.cwd = fs::path{*dir};
                    }
                    project_.print_runs(selected, options, ctx.out());
                    return none;
                }
                if (name == "delete_runs") {
                    project_.delete_runs(selectors_of(args.get(0U, "runs")));
                    return none;
                }
                if (name == "mark") {
                    project_.mark(selectors_of(args.require(0U, "runs", name)), flag(args, 1U, "clear"));
                    return none;
                }
                if (name == "label") {
                    project_.label(selectors_of(args.require(0U, "runs", name)), optional_string(args.get(1U, "label")));
                    return none;
                }
                if (name == "compare") {
                    std::vector<value> rows{};
                    for (const auto& row : project_.compare(selectors_of(args.get(0U, "runs")))) {
                        std::vector<value> cells{};
                        for (const auto& cell : row) {
                            cells.emplace_back(cell);
                        }
                        rows.push_back(value::list(std::move(cells)));
                    }
                    return value::list(std::move(rows));
                }
                if (name == "publish") {
                    auto dest = args.require(1U, "dest", name).as_string();
                    project_.publish(selectors_of(args.get(0U, "runs")), dest);
                    return none;
                }
                if (name == "package") {
                    project_.package(args.require(0U, "dest", name).as_string());
                    return none;
                }
                if (name == "ls") {
                    const auto& run = run_of(args.require(0U, "run", name), name);
                    std::vector<value> out{};
                    for (auto& path : project::ls(run, flag(args, 1U, "all"), flag(args, 2U, "sourcecode"))) {
                        out.emplace_back(std::move(path));
                    }
                    return value::list(std::move(out));
                }
                if (name == "cat") {
                    const auto& run = run_of(args.require(0U, "run", name), name);
                    auto text = project::cat(run, args.require(1U, "path", name).as_string());
                    ctx.out() << text;
                    if (!text.empty() && text.back() != '\n') {
                        ctx.out() << '\n';
                    }
                    return none;
                }
                return std::nullopt;
            }

            std::string repr() const override { return "<Project {}>"_format(project_.cwd().string()); }

          private:
            project project_;
        };

    }  // namespace detail

    value wrap_run(runs::run_record run) {
        return value{std::shared_ptr<object>{std::make_shared<detail::run_object>(std::move(run))}};
    }

    value make_project(arguments& args, execution_context&) {
        detail::expect_keywords(args, {"cwd", "home"}, "Project");
        auto cwd = args.require(0U, "cwd", "Project").as_string();
        std::optional<fs::path> home{};
        if (auto h = detail::optional_string(args.get(1U, "home"))) {
            home = fs::path{*h};
        }
        return value{std::shared_ptr<object>{std::make_shared<detail::project_object>(cwd, std::move(home))}};
    }

}  // namespace litmus::script
