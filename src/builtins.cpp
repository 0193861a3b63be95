#include "litmus/builtins.hpp"

#include "internal/hash.hpp"
#include "internal/paths.hpp"
#include "internal/types.hpp"
#include "litmus/format.hpp"
#include "litmus/guards.hpp"
#include "litmus/harness.hpp"
#include "litmus/runs.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <thread>

using namespace litmus::literals;

namespace litmus::script {

    namespace fs = std::filesystem;

    namespace detail {

        static constexpr std::size_t pprint_width = 79U;

        [[noreturn]] static void os_failure(std::string_view what, const fs::path& path, const std::error_code& ec) {
            throw script_error{errors::os_error, "{} '{}': {}"_format(what, path.string(), ec.message())};
        }

        static fs::path joined(const arguments& args, std::string_view fn) {
            if (args.positional.empty()) {
                throw script_error{errors::type_error, "{}() requires at least one path"_format(fn)};
            }
            fs::path out{};
            for (const auto& part : args.positional) {
                out /= part.as_string();
            }
            return out;
        }

        static fs::path path_arg(const arguments& args, std::size_t index, std::string_view name, std::string_view fn) {
            return fs::path{args.require(index, name, fn).as_string()};
        }

        static std::vector<fs::path> path_list(const value& v) {
            std::vector<fs::path> out{};
            if (v.is_string()) {
                out.emplace_back(v.as_string());
                return out;
            }
            for (const auto& item : v.as_list()) {
                out.emplace_back(item.as_string());
            }
            return out;
        }

        static value string_list(std::vector<std::string> items) {
            std::vector<value> out{};
            out.reserve(items.size());
            for (auto& item : items) {
                out.emplace_back(std::move(item));
            }
            return value::list(std::move(out));
        }

        static void require_file(const fs::path& path) {
            std::error_code ec{};
            if (!fs::is_regular_file(path, ec)) {
                os_failure("no such file", path, std::make_error_code(std::errc::no_such_file_or_directory));
            }
        }

        static std::string read_file(const fs::path& path) {
            require_file(path);
            return internal::read_text_file(path);
        }

        static void print_text(std::ostream& out, std::string_view text) {
            out << text;
            if (!text.empty() && text.back() != '\n') {
                out << '\n';
            }
        }

        static bool sorts_before(const value& lhs, const value& rhs) {
            if (lhs.is_int() && rhs.is_int()) {
                return lhs.as_int() < rhs.as_int();
            }
            if (lhs.is_string() && rhs.is_string()) {
                return lhs.as_string() < rhs.as_string();
            }
            throw script_error{
                    errors::type_error, "cannot order {} and {}"_format(lhs.type_name(), rhs.type_name())};
        }

        static std::string pretty(const value& v) {
            auto flat = repr(v);
            if (flat.size() <= pprint_width || !(v.is_list() || v.is_map())) {
                return flat;
            }
            std::vector<std::string> parts{};
            if (v.is_list()) {
                for (const auto& item : v.as_list()) {
                    parts.push_back(repr(item));
                }
                return "[" + utils::join_with_separator(parts, ",\n "sv) + "]";
            }
            for (const auto& [key, item] : v.as_map()) {
                parts.push_back(repr(value{key}) + ": " + repr(item));
            }
            return "{" + utils::join_with_separator(parts, ",\n "sv) + "}";
        }

        template <typename Guard>
        class guard_object : public object {
          public:
            explicit guard_object(std::shared_ptr<Guard> guard) : guard_{std::move(guard)} {}

            std::string_view type_name() const override { return guard_->name(); }
            std::shared_ptr<scoped_state> guard() override { return guard_; }

          protected:
            std::shared_ptr<Guard> guard_;
        };

        class stderr_capture_object final : public guard_object<scoped_stderr_capture> {
          public:
            using guard_object::guard_object;

            std::optional<value> get_attr(std::string_view name) override {
                if (name == "text") {
                    return guard_->captured();
                }
                return std::nullopt;
            }

            std::optional<value> call_method(std::string_view name, arguments&, execution_context& ctx) override {
                if (name == "print") {
                    guard_->print(ctx.out());
                    return none;
                }
                return std::nullopt;
            }
        };

        class temp_file_object final : public guard_object<scoped_temp_file> {
          public:
            using guard_object::guard_object;

            std::optional<value> get_attr(std::string_view name) override {
                if (name == "path") {
                    return guard_->path().empty() ? value{} : value{guard_->path().string()};
                }
                return std::nullopt;
            }
        };

        // Attribute bag for transcripts that need a stand-in object.
        class proxy_object final : public object {
          public:
            std::string_view type_name() const override { return "Proxy"sv; }

            std::optional<value> get_attr(std::string_view name) override {
                if (auto it = attrs_.find(name); it != attrs_.end()) {
                    return it->second;
                }
                return std::nullopt;
            }

            bool set_attr(std::string_view name, value v) override {
                attrs_.insert_or_assign(std::string{name}, std::move(v));
                return true;
            }

            std::string repr() const override {
                if (attrs_.empty()) {
                    return "<Proxy>";
                }
                std::vector<std::string> parts{};
                for (const auto& [name, v] : attrs_) {
                    parts.push_back("{}={}"_format(name, script::repr(v)));
                }
                return "<Proxy {}>"_format(utils::join_with_separator(parts, " "sv));
            }

          private:
            std::map<std::string, value, std::less<>> attrs_{};
        };

        template <typename Guard, typename Object = guard_object<Guard>, typename... Args>
        static value make_guard(Args&&... args) {
            auto guard = std::make_shared<Guard>(std::forward<Args>(args)...);
            return value{std::shared_ptr<object>{std::make_shared<Object>(std::move(guard))}};
        }

        // -- core -----------------------------------------------------------------------

        static value builtin_print(arguments& args, execution_context& ctx) {
            auto sep = args.keyword("sep").value_or(value{" "}).as_string();
            auto end = args.keyword("end").value_or(value{"\n"}).as_string();
            auto to_stderr = args.keyword("stderr").value_or(value{false}).truthy();

            std::vector<std::string> parts{};
            for (const auto& v : args.positional) {
                parts.push_back(str(v));
            }
            auto& out = to_stderr ? ctx.err() : ctx.out();
            out << utils::join_with_separator(parts, sep) << end;
            return none;
        }

        static value builtin_len(arguments& args, execution_context&) {
            auto v = args.require(0U, "value", "len");
            if (v.is_string()) {
                return v.as_string().size();
            }
            if (v.is_list()) {
                return v.as_list().size();
            }
            if (v.is_map()) {
                return v.as_map().size();
            }
            throw script_error{errors::type_error, "{} has no length"_format(v.type_name())};
        }

        static value builtin_sorted(arguments& args, execution_context&) {
            auto items = args.require(0U, "items", "sorted").as_list();
            std::ranges::sort(items, sorts_before);
            if (args.get(1U, "reverse").value_or(value{false}).truthy()) {
                std::ranges::reverse(items);
            }
            return value::list(std::move(items));
        }

        static value builtin_getenv(arguments& args, execution_context&) {
            auto name = args.require(0U, "name", "getenv").as_string();
            if (auto* v = std::getenv(name.c_str()); v != nullptr) {
                return std::string{v};
            }
            return args.get(1U, "default").value_or(value{});
        }

        static value builtin_sleep(arguments& args, execution_context&) {
            auto seconds = args.require(0U, "seconds", "sleep").as_int();
            std::this_thread::sleep_for(std::chrono::seconds{std::max<int64_t>(seconds, 0)});
            return none;
        }

        // -- guards ---------------------------------------------------------------------

        static value builtin_chdir(arguments& args, execution_context&) {
            return make_guard<scoped_cwd>(path_arg(args, 0U, "path", "Chdir"));
        }

        static value builtin_env(arguments& args, execution_context&) {
            env_overlay overlay{};
            for (const auto& [key, v] : args.require(0U, "vars", "Env").as_map()) {
                overlay.emplace(key, v.is_none() ? std::nullopt : std::optional<std::string>{str(v)});
            }
            return make_guard<scoped_env>(std::move(overlay));
        }

        static value builtin_sys_path_guard(arguments& args, execution_context& ctx) {
            std::optional<scoped_search_path::path_list> replacement{};
            scoped_search_path::path_list prepend{};
            scoped_search_path::path_list append{};
            if (auto v = args.get(0U, "path"); v && !v->is_none()) {
                replacement = path_list(*v);
            }
            if (auto v = args.get(1U, "prepend"); v && !v->is_none()) {
                prepend = path_list(*v);
            }
            if (auto v = args.get(2U, "append"); v && !v->is_none()) {
                append = path_list(*v);
            }
            return make_guard<scoped_search_path>(
                    ctx.env().search_path, std::move(replacement), std::move(prepend), std::move(append));
        }

        static value builtin_user_config_guard(arguments& args, execution_context& ctx) {
            user_config_map payload{};
            for (const auto& [key, v] : args.require(0U, "config", "UserConfig").as_map()) {
                payload.emplace(key, str(v));
            }
            return make_guard<scoped_config>(ctx.env().user_config, std::move(payload));
        }

        static value builtin_model_path_guard(arguments& args, execution_context& ctx) {
            return make_guard<scoped_model_path>(ctx.env().model_path, path_list(args.require(0U, "path", "ModelPath")));
        }

        static value builtin_temp_file(arguments& args, execution_context&) {
            auto prefix = args.get(0U, "prefix").value_or(value{"litmus-"}).as_string();
            auto suffix = args.get(1U, "suffix").value_or(value{""}).as_string();
            auto keep = args.get(2U, "keep").value_or(value{false}).truthy();
            return make_guard<scoped_temp_file, temp_file_object>(std::move(prefix), std::move(suffix), keep);
        }

        static value builtin_stderr_capture(arguments&, execution_context& ctx) {
            return make_guard<scoped_stderr_capture, stderr_capture_object>(ctx.err_sink());
        }

        // -- environment ----------------------------------------------------------------

        static value builtin_user_config(arguments&, execution_context& ctx) {
            std::map<std::string, value> out{};
            for (const auto& [key, v] : ctx.env().user_config.read()) {
                out.emplace(key, v);
            }
            return value::map(std::move(out));
        }

        static value builtin_sys_path(arguments&, execution_context& ctx) {
            std::vector<std::string> out{};
            for (const auto& dir : ctx.env().search_path) {
                out.push_back(dir.string());
            }
            return string_list(std::move(out));
        }

        static value builtin_model_path(arguments&, execution_context& ctx) {
            std::vector<std::string> out{};
            for (const auto& dir : ctx.env().model_path) {
                out.push_back(dir.string());
            }
            return string_list(std::move(out));
        }

        static value builtin_include(arguments& args, execution_context& ctx) {
            auto name = args.require(0U, "name", "include").as_string();
            fs::path requested{name};
            if (!requested.has_extension()) {
                requested += script_extension;
            }

            std::vector<fs::path> candidates{};
            if (requested.is_absolute()) {
                candidates.push_back(requested);
            }
            else {
                for (const auto& dir : ctx.env().search_path) {
                    candidates.push_back(dir / requested);
                }
            }

            std::error_code ec{};
            for (const auto& candidate : candidates) {
                if (fs::is_regular_file(candidate, ec)) {
                    debug_log("including ", candidate.string());
                    evaluate(internal::read_text_file(candidate), ctx, candidate.string());
                    return none;
                }
            }
            throw script_error{errors::os_error, "no script named '{}' on the search path"_format(name)};
        }

        static value builtin_samples_dir(arguments&, execution_context& ctx) {
            if (!ctx.env().samples_dir) {
                throw script_error{errors::os_error, "no samples directory is configured"};
            }
            return ctx.env().samples_dir->string();
        }

        static value builtin_sample(arguments& args, execution_context& ctx) {
            auto root = fs::path{builtin_samples_dir(args, ctx).as_string()};
            for (const auto& part : args.positional) {
                root /= part.as_string();
            }
            return root.string();
        }

        static value builtin_mkdtemp(arguments& args, execution_context&) {
            auto prefix = args.get(0U, "prefix").value_or(value{"litmus-test-"}).as_string();
            return runs::mkdtemp(prefix).string();
        }

        // -- files and paths ------------------------------------------------------------

        static value builtin_join_path(arguments& args, execution_context&) {
            return joined(args, "join_path").string();
        }

        static value builtin_abspath(arguments& args, execution_context&) {
            return fs::absolute(path_arg(args, 0U, "path", "abspath")).lexically_normal().string();
        }

        static value builtin_realpath(arguments& args, execution_context&) {
            auto path = path_arg(args, 0U, "path", "realpath");
            std::error_code ec{};
            auto resolved = fs::weakly_canonical(path, ec);
            if (ec) {
                os_failure("cannot resolve", path, ec);
            }
            return resolved.string();
        }

        static value builtin_relpath(arguments& args, execution_context&) {
            auto path = fs::absolute(path_arg(args, 0U, "path", "relpath")).lexically_normal();
            auto start = fs::current_path();
            if (auto v = args.get(1U, "start"); v && !v->is_none()) {
                start = fs::absolute(v->as_string()).lexically_normal();
            }
            auto rel = path.lexically_relative(start);
            return rel.empty() ? std::string{"."} : rel.string();
        }

        static value builtin_basename(arguments& args, execution_context&) {
            return path_arg(args, 0U, "path", "basename").filename().string();
        }

        static value builtin_dirname(arguments& args, execution_context&) {
            return path_arg(args, 0U, "path", "dirname").parent_path().string();
        }

        static value builtin_exists(arguments& args, execution_context&) {
            std::error_code ec{};
            return fs::exists(path_arg(args, 0U, "path", "exists"), ec);
        }

        static value builtin_mkdir(arguments& args, execution_context&) {
            auto path = path_arg(args, 0U, "path", "mkdir");
            std::error_code ec{};
            fs::create_directories(path, ec);
            if (ec) {
                os_failure("cannot create directory", path, ec);
            }
            return none;
        }

        static value builtin_write(arguments& args, execution_context&) {
            auto path = path_arg(args, 0U, "path", "write");
            auto text = str(args.require(1U, "text", "write"));
            auto append = args.get(2U, "append").value_or(value{false}).truthy();

            std::ofstream out{path, append ? std::ios::app : std::ios::trunc};
            if (!out) {
                os_failure("cannot open", path, std::make_error_code(std::errc::io_error));
            }
            out << text;
            return none;
        }

        static value builtin_cat(arguments& args, execution_context& ctx) {
            print_text(ctx.out(), read_file(joined(args, "cat")));
            return none;
        }

        static value builtin_touch(arguments& args, execution_context&) {
            auto path = path_arg(args, 0U, "path", "touch");
            std::error_code ec{};
            if (fs::exists(path, ec)) {
                fs::last_write_time(path, fs::file_time_type::clock::now(), ec);
            }
            else {
                std::ofstream out{path, std::ios::app};
                if (!out) {
                    ec = std::make_error_code(std::errc::io_error);
                }
            }
            if (ec) {
                os_failure("cannot touch", path, ec);
            }
            return none;
        }

        static value builtin_symlink(arguments& args, execution_context&) {
            auto target = path_arg(args, 0U, "target", "symlink");
            auto link = path_arg(args, 1U, "link", "symlink");
            std::error_code ec{};
            fs::create_symlink(target, link, ec);
            if (ec) {
                os_failure("cannot create symlink", link, ec);
            }
            return none;
        }

        static value builtin_copytree(arguments& args, execution_context&) {
            auto source = path_arg(args, 0U, "src", "copytree");
            auto dest = path_arg(args, 1U, "dest", "copytree");
            std::error_code ec{};
            if (fs::exists(dest, ec)) {
                os_failure("destination exists", dest, std::make_error_code(std::errc::file_exists));
            }
            fs::copy(source, dest, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
            if (ec) {
                os_failure("cannot copy", source, ec);
            }
            return none;
        }

        static value builtin_find(arguments& args, execution_context& ctx) {
            auto found = internal::find_relative(path_arg(args, 0U, "root", "find"));
            if (found.empty()) {
                ctx.out() << "<empty>\n";
            }
            for (const auto& path : found) {
                ctx.out() << path << '\n';
            }
            return none;
        }

        static value builtin_find2(arguments& args, execution_context&) {
            return string_list(internal::find_relative(path_arg(args, 0U, "root", "find2")));
        }

        static value builtin_dir(arguments& args, execution_context&) {
            auto path = path_arg(args, 0U, "path", "dir");
            std::vector<std::string> ignore{};
            if (auto v = args.get(1U, "ignore"); v && !v->is_none()) {
                for (const auto& pattern : v->as_list()) {
                    ignore.push_back(pattern.as_string());
                }
            }
            return string_list(internal::list_dir(path, ignore));
        }

        static value builtin_sha256(arguments& args, execution_context&) {
            auto path = path_arg(args, 0U, "path", "sha256");
            require_file(path);
            return internal::sha256_file(path);
        }

        static value builtin_compare_paths(arguments& args, execution_context&) {
            std::error_code ec_a{};
            std::error_code ec_b{};
            auto a = fs::weakly_canonical(path_arg(args, 0U, "a", "compare_paths"), ec_a);
            auto b = fs::weakly_canonical(path_arg(args, 1U, "b", "compare_paths"), ec_b);
            return !ec_a && !ec_b && a == b;
        }

        struct builtin_entry {
            std::string_view name;
            value (*fn)(arguments&, execution_context&);
        };

        static constexpr builtin_entry builtin_table[] = {
                {"print"sv, builtin_print},
                {"str"sv, [](arguments& args, execution_context&) -> value { return str(args.require(0U, "value", "str")); }},
                {"repr"sv, [](arguments& args, execution_context&) -> value { return repr(args.require(0U, "value", "repr")); }},
                {"len"sv, builtin_len},
                {"sorted"sv, builtin_sorted},
                {"pprint"sv,
                 [](arguments& args, execution_context& ctx) -> value {
                     ctx.out() << pretty(args.require(0U, "value", "pprint")) << '\n';
                     return none;
                 }},
                {"getenv"sv, builtin_getenv},
                {"cwd"sv, [](arguments&, execution_context&) -> value { return fs::current_path().string(); }},
                {"sleep"sv, builtin_sleep},
                {"Chdir"sv, builtin_chdir},
                {"Env"sv, builtin_env},
                {"SysPath"sv, builtin_sys_path_guard},
                {"UserConfig"sv, builtin_user_config_guard},
                {"StderrCapture"sv, builtin_stderr_capture},
                {"ModelPath"sv, builtin_model_path_guard},
                {"TempFile"sv, builtin_temp_file},
                {"Proxy"sv, [](arguments&, execution_context&) -> value {
                     return value{std::shared_ptr<object>{std::make_shared<proxy_object>()}};
                 }},
                {"Project"sv, make_project},
                {"mktemp_home"sv, [](arguments&, execution_context&) -> value { return runs::mktemp_home().string(); }},
                {"mkdtemp"sv, builtin_mkdtemp},
                {"user_config"sv, builtin_user_config},
                {"sys_path"sv, builtin_sys_path},
                {"model_path"sv, builtin_model_path},
                {"include"sv, builtin_include},
                {"path"sv, builtin_join_path},
                {"join_path"sv, builtin_join_path},
                {"abspath"sv, builtin_abspath},
                {"realpath"sv, builtin_realpath},
                {"relpath"sv, builtin_relpath},
                {"basename"sv, builtin_basename},
                {"dirname"sv, builtin_dirname},
                {"exists"sv, builtin_exists},
                {"mkdir"sv, builtin_mkdir},
                {"write"sv, builtin_write},
                {"cat"sv, builtin_cat},
                {"touch"sv, builtin_touch},
                {"symlink"sv, builtin_symlink},
                {"copytree"sv, builtin_copytree},
                {"find"sv, builtin_find},
                {"find2"sv, builtin_find2},
                {"dir"sv, builtin_dir},
                {"sha256"sv, builtin_sha256},
                {"compare_paths"sv, builtin_compare_paths},
                {"sample"sv, builtin_sample},
                {"samples_dir"sv, builtin_samples_dir},
        };

    }  // namespace detail

    void install_builtins(symbol_table& names) {
        for (const auto& entry : detail::builtin_table) {
            names.assign(std::string{entry.name}, value::function(std::string{entry.name}, entry.fn));
        }
    }

    std::vector<std::string> builtin_names() {
        std::vector<std::string> out{};
        for (const auto& entry : detail::builtin_table) {
            out.emplace_back(entry.name);
        }
        std::ranges::sort(out);
        return out;
    }

}  // namespace litmus::script
