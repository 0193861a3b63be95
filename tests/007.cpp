#include "utils.hpp"

namespace litmus::test {
    using namespace std::string_view_literals;

    namespace detail {

        static runs::run_record seed_run(
                const runs::run_store& store, std::string id, std::string opspec, int64_t started, bool marked = false) {
            runs::run_attrs attrs{};
            attrs.id = std::move(id);
            attrs.opspec = std::move(opspec);
            attrs.started = started;
            attrs.status = runs::run_status::completed;
            attrs.marked = marked;
            auto dir = store.run_dir(attrs.id);
            runs::write_attrs(dir, attrs);
            return runs::run_record{dir, attrs};
        }

    }  // namespace detail

    TEST_CASE("007: mkid yields ordered hex identifiers", "[007][runs][id]") {
        auto first = runs::mkid();
        auto second = runs::mkid();
        CHECK(first.size() == 32U);
        CHECK(std::ranges::all_of(first, [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }));
        CHECK(first != second);
        CHECK(first < second);
    }

    TEST_CASE("007: attrs persist as json metadata", "[007][runs][attrs]") {
        detail::temp_dir dir{"litmus_attrs"};
        runs::run_attrs attrs{};
        attrs.id = "abc";
        attrs.opspec = "echo hi";
        attrs.flags = {{"lr", "0.1"}};
        attrs.status = runs::run_status::error;
        attrs.exit_status = 3;
        attrs.label = "first";
        runs::write_attrs(dir.path, attrs);

        auto loaded = runs::read_attrs(dir.path);
        REQUIRE(loaded);
        CHECK(loaded->opspec == "echo hi");
        CHECK(loaded->flags.at("lr") == "0.1");
        CHECK(loaded->status == runs::run_status::error);
        CHECK(loaded->exit_status == 3);
        CHECK(loaded->label == "first");
        CHECK_FALSE(loaded->stopped);

        auto raw = detail::read_text_file(runs::meta_dir(dir.path) / runs::attrs_filename);
        CHECK(raw.find("\"status\": \"error\"") != std::string::npos);

        CHECK_FALSE(runs::read_attrs(dir.path / "elsewhere"));
        auto bare = runs::run_record::from_dir(dir.path / "0123456789abcdef");
        CHECK(bare.id() == "0123456789abcdef");
        CHECK(bare.short_id() == "01234567");
    }

    TEST_CASE("007: newer schema versions are rejected", "[007][runs][attrs]") {
        detail::temp_dir dir{"litmus_schema"};
        detail::write_text_file(runs::meta_dir(dir.path) / runs::attrs_filename, R"({"schema_version": 9, "id": "x"})");
        CHECK_THROWS_AS(runs::read_attrs(dir.path), std::runtime_error);
    }

    TEST_CASE("007: lookup prefers operation, then index, then id prefix", "[007][runs][lookup]") {
        detail::temp_dir dir{"litmus_lookup"};
        runs::run_store store{runs::init_home(dir.path)};

        detail::seed_run(store, "aaaa1111", "train", 100);
        detail::seed_run(store, "aaaa2222", "train", 200);
        detail::seed_run(store, "bbbb3333", "eval", 300);

        auto listed = store.runs();
        REQUIRE(listed.size() == 3U);
        CHECK(listed[0].id() == "bbbb3333");
        CHECK(listed[2].id() == "aaaa1111");

        SECTION("operation name picks the latest run") {
            CHECK(store.lookup("train").id() == "aaaa2222");
        }

        SECTION("a marked run wins over the latest") {
            detail::seed_run(store, "aaaa1111", "train", 100, true);
            CHECK(store.lookup("train").id() == "aaaa1111");
        }

        SECTION("1-based index over the newest-first list") {
            CHECK(store.lookup("1").id() == "bbbb3333");
            CHECK(store.lookup("3").id() == "aaaa1111");
        }

        SECTION("unique id prefix") {
            CHECK(store.lookup("bbbb").id() == "bbbb3333");
            CHECK(store.lookup("aaaa2").id() == "aaaa2222");
        }

        SECTION("zero or several matches fail") {
            CHECK_THROWS_AS(store.lookup("aaaa"), runs::resolve_error);
            CHECK_THROWS_AS(store.lookup("zzzz"), runs::resolve_error);
            CHECK_THROWS_AS(store.lookup(""), runs::resolve_error);
        }

        SECTION("select deduplicates in selector order") {
            auto selected = store.select({"eval", "bbbb", "train"});
            REQUIRE(selected.size() == 2U);
            CHECK(selected[0].id() == "bbbb3333");
            CHECK(selected[1].id() == "aaaa2222");
            CHECK(store.select({}).size() == 3U);
        }
    }

    TEST_CASE("007: resolve_run_dir follows the fallback chain", "[007][runs][resolve]") {
        detail::temp_dir dir{"litmus_resolve"};
        runs::run_store store{runs::init_home(dir.path)};
        auto seeded = detail::seed_run(store, "cccc4444", "train", 100);

        SECTION("explicit directory wins") {
            runs::run_request request{};
            request.run_dir = dir.path / "explicit";
            request.rerun = "train";
            CHECK(runs::resolve_run_dir(store, request) == dir.path / "explicit");
        }

        SECTION("rerun and restart select an existing run") {
            runs::run_request rerun{};
            rerun.rerun = "train";
            CHECK(runs::resolve_run_dir(store, rerun) == seeded.dir());

            runs::run_request restart{};
            restart.restart = "cccc";
            CHECK(runs::resolve_run_dir(store, restart) == seeded.dir());
        }

        SECTION("unknown selectors fail") {
            runs::run_request request{};
            request.restart = "missing";
            CHECK_THROWS_AS(runs::resolve_run_dir(store, request), runs::resolve_error);
        }

        SECTION("rerun and restart together fail") {
            runs::run_request request{};
            request.rerun = "train";
            request.restart = "train";
            CHECK_THROWS_AS(runs::resolve_run_dir(store, request), runs::resolve_error);
        }

        SECTION("otherwise a new id is minted but not created") {
            runs::run_request request{};
            auto resolved = runs::resolve_run_dir(store, request);
            CHECK(resolved.parent_path() == store.runs_dir());
            CHECK(resolved.filename().string().size() == 32U);
            CHECK_FALSE(std::filesystem::exists(resolved));
            REQUIRE(request.run_dir);
            CHECK(*request.run_dir == resolved);

            // resolving again reuses the stored directory
            CHECK(runs::resolve_run_dir(store, request) == resolved);
        }
    }

}  // namespace litmus::test
