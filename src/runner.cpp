#include "litmus/runner.hpp"

#include "litmus/builtins.hpp"
#include "litmus/format.hpp"
#include "litmus/interpreter.hpp"
#include "litmus/user_config.hpp"

#include <algorithm>
#include <sstream>

using namespace litmus::literals;

namespace litmus {

    namespace detail {

        static constexpr auto report_separator =
                "**********************************************************************"sv;

        static void write_indented(std::string& out, std::string_view text) {
            for (const auto& line : utils::split_lines(text)) {
                out += "    ";
                out += line;
                out.push_back('\n');
            }
        }

        // An uncaught evaluation failure becomes the last line of the example output.
        static void append_error_line(std::ostringstream& got, std::string_view line) {
            auto text = got.view();
            if (!text.empty() && text.back() != '\n') {
                got << '\n';
            }
            got << line << '\n';
        }

    }  // namespace detail

    std::string capture_evaluation(std::string_view source, script::execution_context& ctx) {
        auto& previous_out = ctx.out();
        auto& previous_err = ctx.err();

        std::ostringstream got{};
        ctx.set_out(got);
        ctx.set_err(got);
        try {
            script::evaluate(source, ctx, "<example>"sv);
        }
        catch (const error& e) {
            detail::append_error_line(got, strip_error_module("{}: {}"_format(e.kind(), e.message())));
        }
        catch (const std::exception& e) {
            detail::append_error_line(got, "error: {}"_format(e.what()));
        }
        ctx.set_out(previous_out);
        ctx.set_err(previous_err);
        return got.str();
    }

    std::string format_failure(const transcript_file& file, const example& ex, const match_result& match) {
        std::string out{detail::report_separator};
        out += "\nFile \"{}\", line {}, in {}\n"_format(file.path.string(), ex.line + 1U, file.name);
        out += "Failed example:\n";
        detail::write_indented(out, ex.source);
        if (match.want.empty()) {
            out += "Expected nothing\n";
        }
        else {
            out += "Expected:\n";
            detail::write_indented(out, match.want);
        }
        if (match.got.empty()) {
            out += "Got nothing\n";
        }
        else {
            out += "Got:\n";
            detail::write_indented(out, match.got);
        }
        return out;
    }

    test_runner::test_runner(startup_config config, std::ostream& progress)
            : config_{std::move(config)}, progress_{progress} {}

    option_flags test_runner::default_flags() const {
        auto flags = option_flag::ellipsis | option_flag::normalize_whitespace;
        if (config_.platform == platform_kind::windows) {
            flags.set(option_flag::normalize_paths);
        }
        if (config_.report_first_failure) {
            flags.set(option_flag::report_only_first_failure);
        }
        return flags;
    }

    std::string test_runner::padding(std::string_view name) const {
        return std::string(config_.name_width > name.size() ? config_.name_width - name.size() : 0U, ' ');
    }

    file_result test_runner::run_file(const transcript_file& file) const {
        file_result result{};
        result.name = file.name;

        config_provider user_config{config_.user_config_path};
        script::runtime_environment env{config_.search_path, user_config, config_.samples_dir};
        script::symbol_table names{};
        script::install_builtins(names);

        std::ostringstream idle{};
        script::execution_context ctx{names, env, idle, idle};
        capture_table captures{};

        auto file_flags = file.head.options.apply(default_flags());
        auto first_failure_only = file_flags.has(option_flag::report_only_first_failure);
        for (const auto& ex : file.examples) {
            auto flags = ex.options.apply(file_flags);
            auto platform_skip = config_.platform == platform_kind::windows && !flags.has(option_flag::windows);
            if (flags.has(option_flag::skip) || platform_skip) {
                ++result.skipped;
                continue;
            }
            ++result.attempted;
            if (config_.captures == capture_scope::example) {
                captures.clear();
            }

            auto got = capture_evaluation(ex.source, ctx);
            auto match = check_output(ex.want, got, flags, captures);
            if (match.matched) {
                captures.merge(match.bindings);
                continue;
            }

            ++result.failed;
            debug_log(file.name, ": example at line ", ex.line + 1U, " failed");
            if (!first_failure_only || result.failed == 1U) {
                result.report += format_failure(file, ex, match);
            }
        }
        return result;
    }

    bool test_runner::run_test(std::string_view name) {
        progress_ << "  " << name << ": " << std::flush;

        transcript_file file{};
        try {
            file = load_transcript(config_.tests_dir, name);
        }
        catch (const transcript_not_found&) {
            progress_ << " ERROR test not found\n";
            return false;
        }
        catch (const std::runtime_error& e) {
            progress_ << padding(name) << "ERROR " << e.what() << '\n';
            return false;
        }

        if (file.head.skips(config_.platform)) {
            progress_ << padding(name) << "ok (skipped test on {})\n"_format(to_string(config_.platform));
            return true;
        }

        auto result = run_file(file);
        if (result.ok()) {
            progress_ << padding(name) << "ok\n";
            return true;
        }
        progress_ << padding(name) << "FAILED ({} of {} examples)\n"_format(result.failed, result.attempted);
        progress_ << result.report << std::flush;
        return false;
    }

    bool test_runner::run(const std::vector<std::string>& tests, const std::vector<std::string>& skip) {
        progress_ << "transcript tests:\n";
        bool success = true;
        for (const auto& name : tests) {
            if (std::ranges::find(skip, name) != skip.end()) {
                progress_ << "  " << name << ":" << padding(name) << " skipped\n";
                continue;
            }
            success = run_test(name) && success;
        }
        progress_ << std::flush;
        return success;
    }

    bool test_runner::run_all(const std::vector<std::string>& skip) {
        return run(all_tests(config_.tests_dir), skip);
    }

}  // namespace litmus
