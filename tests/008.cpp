#include "utils.hpp"

namespace litmus::test {
    using namespace std::string_view_literals;

    namespace detail {

        static runs::run_request shell_request(std::string opspec, const fs::path& cwd) {
            runs::run_request request{};
            request.opspec = std::move(opspec);
            request.cwd = cwd;
            return request;
        }

    }  // namespace detail

    TEST_CASE("008: local backend records a completed run", "[008][backend][run]") {
        detail::temp_dir home{"litmus_backend_home"};
        detail::temp_dir work{"litmus_backend_work"};
        runs::local_backend backend{runs::init_home(home.path)};

        auto request = detail::shell_request("echo", work.path);
        request.flags = {{"epochs", "3"}, {"name", "two words"}};
        request.label = "baseline";
        auto outcome = backend.run(request);

        CHECK(outcome.output == "--epochs=3 --name=two words\n");
        CHECK(outcome.dir.parent_path() == backend.store().runs_dir());
        CHECK(runs::read_output(outcome.dir) == outcome.output);

        auto record = runs::run_record::from_dir(outcome.dir);
        CHECK(record.attrs().status == runs::run_status::completed);
        CHECK(record.attrs().exit_status == 0);
        CHECK(record.attrs().stopped);
        CHECK(record.attrs().label == "baseline");
        CHECK(record.attrs().cwd == work.path.string());
        CHECK(record.attrs().flags.at("name") == "two words");
    }

    TEST_CASE("008: operations see their run directory", "[008][backend][run]") {
        detail::temp_dir home{"litmus_backend_env"};
        runs::local_backend backend{runs::init_home(home.path)};

        auto request = detail::shell_request("printf '%s|%s\\n' \"$LITMUS_RUN_DIR\" \"$EXTRA\"", home.path);
        request.env = {{"EXTRA", "value"}};
        auto outcome = backend.run(request);
        CHECK(outcome.output == outcome.dir.string() + "|value\n");
    }

    TEST_CASE("008: abnormal exits raise run_error with output", "[008][backend][run]") {
        detail::temp_dir home{"litmus_backend_fail"};
        runs::local_backend backend{runs::init_home(home.path)};

        try {
            backend.run(detail::shell_request("echo boom; exit 3", home.path));
            FAIL("expected run_error");
        }
        catch (const runs::run_error& e) {
            CHECK(e.exit_code() == 3);
            CHECK(e.output() == "boom\n");
            auto record = runs::run_record::from_dir(e.dir());
            CHECK(record.attrs().status == runs::run_status::error);
            CHECK(record.attrs().exit_status == 3);
        }

        CHECK_THROWS_AS(backend.run(runs::run_request{}), std::invalid_argument);
    }

    TEST_CASE("008: reusing an explicit directory warns unless silenced", "[008][backend][warning]") {
        detail::temp_dir home{"litmus_backend_warn"};
        runs::local_backend backend{runs::init_home(home.path)};
        auto dir = home.path / "explicit";
        std::filesystem::create_directories(dir);

        auto request = detail::shell_request("echo done", home.path);
        request.run_dir = dir;

        SECTION("warning printed") {
            detail::scoped_env_var unset{std::string{runs::no_warn_rundir_env}, std::nullopt};
            auto outcome = backend.run(request);
            CHECK(outcome.output == "WARNING: using existing run directory " + dir.string() + "\ndone\n");
        }

        SECTION("warning silenced") {
            detail::scoped_env_var quiet{std::string{runs::no_warn_rundir_env}, "1"};
            auto outcome = backend.run(request);
            CHECK(outcome.output == "done\n");
        }
    }

    TEST_CASE("008: rerun clears run files and restart keeps them", "[008][backend][resume]") {
        detail::temp_dir home{"litmus_backend_resume"};
        runs::local_backend backend{runs::init_home(home.path)};

        auto first = backend.run(detail::shell_request("echo run >> \"$LITMUS_RUN_DIR/log.txt\"; echo", home.path));
        auto id = first.dir.filename().string();
        auto original = runs::run_record::from_dir(first.dir);

        runs::run_request restart{};
        restart.restart = id;
        restart.cwd = home.path;
        auto restarted = backend.run(restart);
        CHECK(restarted.dir == first.dir);
        CHECK(detail::read_text_file(first.dir / "log.txt") == "run\nrun\n");

        runs::run_request rerun{};
        rerun.rerun = id;
        rerun.cwd = home.path;
        rerun.flags = {{"seed", "7"}};
        auto rerun_outcome = backend.run(rerun);
        CHECK(rerun_outcome.dir == first.dir);
        CHECK(rerun_outcome.output == "--seed=7\n");
        CHECK(detail::read_text_file(first.dir / "log.txt") == "run\n");

        auto record = runs::run_record::from_dir(first.dir);
        CHECK(record.id() == original.id());
        CHECK(record.attrs().opspec == original.attrs().opspec);
        CHECK(record.attrs().flags.at("seed") == "7");
        CHECK(backend.store().runs().size() == 1U);
    }

    TEST_CASE("008: new runs snapshot visible source files", "[008][backend][sourcecode]") {
        detail::temp_dir home{"litmus_backend_src_home"};
        detail::temp_dir work{"litmus_backend_src"};
        detail::write_text_file(work.path / "train.py", "print(1)\n");
        detail::write_text_file(work.path / "pkg" / "util.py", "x = 1\n");
        detail::write_text_file(work.path / ".hidden" / "secret", "no\n");

        runs::local_backend backend{runs::init_home(home.path)};
        auto outcome = backend.run(detail::shell_request("true", work.path));

        auto snapshot = runs::meta_dir(outcome.dir) / runs::sourcecode_subdir;
        CHECK(internal::find_relative(snapshot) == std::vector<std::string>{"pkg/util.py", "train.py"});
    }

    TEST_CASE("008: mark, label, list and delete select runs", "[008][backend][manage]") {
        detail::temp_dir home{"litmus_backend_manage"};
        runs::local_backend backend{runs::init_home(home.path)};
        auto a = backend.run(detail::shell_request("echo a", home.path));
        auto b = backend.run(detail::shell_request("echo b", home.path));
        CHECK_THROWS_AS(backend.run(detail::shell_request("exit 1", home.path)), runs::run_error);

        auto marked = backend.mark({"echo a"}, false);
        REQUIRE(marked.size() == 1U);
        CHECK(marked[0].attrs().marked);

        runs::list_filter only_marked{};
        only_marked.marked_only = true;
        auto listed = backend.runs_list(only_marked);
        REQUIRE(listed.size() == 1U);
        CHECK(listed[0].dir() == a.dir);

        runs::list_filter failed{};
        failed.status = runs::run_status::error;
        CHECK(backend.runs_list(failed).size() == 1U);

        backend.mark({"echo a"}, true);
        CHECK(backend.runs_list(only_marked).empty());

        auto labeled = backend.label({"echo b"}, std::string{"best"});
        REQUIRE(labeled.size() == 1U);
        CHECK(runs::run_record::from_dir(b.dir).attrs().label == "best");
        backend.label({"echo b"}, std::nullopt);
        CHECK_FALSE(runs::run_record::from_dir(b.dir).attrs().label);

        auto deleted = backend.runs_delete({"echo a"});
        REQUIRE(deleted.size() == 1U);
        CHECK_FALSE(std::filesystem::exists(a.dir));
        CHECK(backend.runs_list({}).size() == 2U);

        backend.runs_delete({});
        CHECK(backend.runs_list({}).empty());
    }

    TEST_CASE("008: compare lays out one column per flag", "[008][backend][compare]") {
        detail::temp_dir home{"litmus_backend_compare"};
        runs::local_backend backend{runs::init_home(home.path)};

        auto first = detail::shell_request("true", home.path);
        first.flags = {{"lr", "0.1"}};
        auto a = backend.run(first);
        auto second = detail::shell_request("true", home.path);
        second.flags = {{"batch", "8"}};
        auto b = backend.run(second);

        auto rows = backend.compare({});
        REQUIRE(rows.size() == 3U);
        CHECK(rows[0] == std::vector<std::string>{"run", "operation", "status", "batch", "lr"});
        CHECK(rows[1] == std::vector<std::string>{b.dir.filename().string().substr(0U, 8U), "true", "completed", "8", ""});
        CHECK(rows[2] == std::vector<std::string>{a.dir.filename().string().substr(0U, 8U), "true", "completed", "", "0.1"});
    }

    TEST_CASE("008: publish copies runs with a summary", "[008][backend][publish]") {
        detail::temp_dir home{"litmus_backend_publish"};
        runs::local_backend backend{runs::init_home(home.path)};
        auto outcome = backend.run(detail::shell_request("echo published", home.path));
        auto id = outcome.dir.filename().string();

        auto dest = home.path / "published";
        auto copied = backend.publish({}, dest);
        REQUIRE(copied.size() == 1U);
        CHECK(copied[0] == dest / id);
        CHECK(runs::read_output(dest / id) == "published\n");

        auto summary = internal::read_json_file<internal::publish_summary>(dest / runs::publish_summary_filename);
        REQUIRE(summary.runs.size() == 1U);
        CHECK(summary.runs[0].id == id);
        CHECK(summary.runs[0].status == "completed");
    }

    TEST_CASE("008: package writes a manifest of visible files", "[008][backend][package]") {
        detail::temp_dir work{"litmus_backend_package"};
        detail::write_text_file(work.path / "a.txt", "hello");
        detail::write_text_file(work.path / "sub" / "b.txt", "world");
        detail::write_text_file(work.path / ".git" / "HEAD", "ref");

        runs::local_backend backend{runs::init_home(work.path / ".home")};
        auto dest = backend.package(work.path, work.path / "dist");

        CHECK(std::filesystem::exists(dest / "a.txt"));
        CHECK(std::filesystem::exists(dest / "sub" / "b.txt"));
        CHECK_FALSE(std::filesystem::exists(dest / ".git"));
        CHECK(detail::read_text_file(dest / runs::manifest_filename) ==
              "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824  a.txt\n"
              "486ea46224d1bb4fb680f34f7c9ad96a8f24ec88be73ea8e5a6c65260e9cb8a7  sub/b.txt\n");
    }

    TEST_CASE("008: shell quoting leaves safe words alone", "[008][backend]") {
        CHECK(runs::shell_quote("abc-1.0/x") == "abc-1.0/x");
        CHECK(runs::shell_quote("") == "''");
        CHECK(runs::shell_quote("it's") == "'it'\\''s'");
        CHECK(runs::format_flags({{"a", "1"}, {"b", "2"}}) == "a=1 b=2");
        CHECK(runs::format_flags({{"a", "1"}, {"b", "2"}}, ", "sv) == "a=1, b=2");
    }

}  // namespace litmus::test
