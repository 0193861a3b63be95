#include "utils.hpp"

namespace litmus::test {
    using namespace std::string_view_literals;

    namespace detail {

        // Records enter/exit order into a shared log.
        class recording_state final : public scoped_state {
          public:
            recording_state(std::string label, std::vector<std::string>& log, bool fail_enter = false)
                    : label_{std::move(label)}, log_{log}, fail_enter_{fail_enter} {}
            ~recording_state() override { exit(); }

            std::string_view name() const override { return "Recording"; }

          protected:
            void on_enter() override {
                if (fail_enter_) {
                    throw std::runtime_error("enter failed");
                }
                log_.push_back("enter " + label_);
            }
            void on_exit() noexcept override { log_.push_back("exit " + label_); }

          private:
            std::string label_{};
            std::vector<std::string>& log_;
            bool fail_enter_{false};
        };

    }  // namespace detail

    TEST_CASE("006: resource stack unwinds strictly last-in first-out", "[006][guards][stack]") {
        std::vector<std::string> log{};
        {
            resource_stack stack{};
            stack.push(std::make_shared<detail::recording_state>("a", log));
            stack.push(std::make_shared<detail::recording_state>("b", log));
            auto depth = stack.depth();
            stack.push(std::make_shared<detail::recording_state>("c", log));
            stack.unwind_to(depth);
            CHECK(stack.depth() == 2U);
            stack.push(std::make_shared<detail::recording_state>("d", log));
        }
        CHECK(log == std::vector<std::string>{"enter a", "enter b", "enter c", "exit c", "enter d", "exit d", "exit b", "exit a"});
    }

    TEST_CASE("006: failed enter is not retained", "[006][guards][stack]") {
        std::vector<std::string> log{};
        resource_stack stack{};
        stack.push(std::make_shared<detail::recording_state>("a", log));
        CHECK_THROWS_AS(stack.push(std::make_shared<detail::recording_state>("b", log, true)), std::runtime_error);
        CHECK(stack.depth() == 1U);
        stack.unwind_to(0U);
        CHECK(log == std::vector<std::string>{"enter a", "exit a"});
    }

    TEST_CASE("006: guards restore exactly once", "[006][guards]") {
        std::vector<std::string> log{};
        detail::recording_state state{"x", log};
        state.enter();
        CHECK(state.entered());
        CHECK_THROWS_AS(state.enter(), std::runtime_error);
        state.exit();
        state.exit();
        CHECK(log == std::vector<std::string>{"enter x", "exit x"});
    }

    TEST_CASE("006: working directory guard", "[006][guards][cwd]") {
        detail::temp_dir dir{"litmus_cwd"};
        auto before = std::filesystem::current_path();
        {
            scoped_cwd guard{dir.path};
            guard.enter();
            CHECK(std::filesystem::equivalent(std::filesystem::current_path(), dir.path));
        }
        CHECK(std::filesystem::current_path() == before);

        scoped_cwd missing{dir.path / "does-not-exist"};
        CHECK_THROWS_AS(missing.enter(), std::runtime_error);
        CHECK_FALSE(missing.entered());
        CHECK(std::filesystem::current_path() == before);
    }

    TEST_CASE("006: environment guard restores presence per name", "[006][guards][env]") {
        detail::scoped_env_var existing{"LITMUS_GUARD_EXISTING", "old"};
        detail::scoped_env_var absent{"LITMUS_GUARD_ABSENT", std::nullopt};
        detail::scoped_env_var removed{"LITMUS_GUARD_REMOVED", "keep"};

        {
            scoped_env guard{env_overlay{
                    {"LITMUS_GUARD_EXISTING", "new"},
                    {"LITMUS_GUARD_ABSENT", "set"},
                    {"LITMUS_GUARD_REMOVED", std::nullopt}}};
            guard.enter();
            CHECK(detail::env_value("LITMUS_GUARD_EXISTING") == "new");
            CHECK(detail::env_value("LITMUS_GUARD_ABSENT") == "set");
            CHECK_FALSE(detail::env_value("LITMUS_GUARD_REMOVED"));
        }

        CHECK(detail::env_value("LITMUS_GUARD_EXISTING") == "old");
        CHECK_FALSE(detail::env_value("LITMUS_GUARD_ABSENT"));
        CHECK(detail::env_value("LITMUS_GUARD_REMOVED") == "keep");
    }

    TEST_CASE("006: search path guard replaces, prepends and appends", "[006][guards][path]") {
        std::vector<std::filesystem::path> search{"/base"};

        {
            scoped_search_path guard{search, std::nullopt, {"/first"}, {"/last"}};
            guard.enter();
            CHECK(search == std::vector<std::filesystem::path>{"/first", "/base", "/last"});

            scoped_search_path nested{search, std::vector<std::filesystem::path>{"/only"}};
            nested.enter();
            CHECK(search == std::vector<std::filesystem::path>{"/only"});
            nested.exit();
            CHECK(search == std::vector<std::filesystem::path>{"/first", "/base", "/last"});
        }
        CHECK(search == std::vector<std::filesystem::path>{"/base"});
    }

    TEST_CASE("006: config guard overrides and forces a fresh read", "[006][guards][config]") {
        detail::temp_dir dir{"litmus_config"};
        auto path = dir.path / "config.json";
        detail::write_text_file(path, R"({"name": "disk"})");

        config_provider provider{path};
        CHECK(provider.read().at("name") == "disk");

        {
            scoped_config guard{provider, user_config_map{{"name", "memory"}}};
            guard.enter();
            CHECK(provider.has_override());
            CHECK(provider.read().at("name") == "memory");

            detail::write_text_file(path, R"({"name": "updated"})");
        }

        CHECK_FALSE(provider.has_override());
        CHECK(provider.read().at("name") == "updated");
    }

    TEST_CASE("006: nested config guards restore the enclosing override", "[006][guards][config][nested]") {
        detail::temp_dir dir{"litmus_config_nested"};
        auto path = dir.path / "config.json";
        detail::write_text_file(path, R"({"name": "disk"})");

        config_provider provider{path};
        {
            scoped_config outer{provider, user_config_map{{"name", "outer"}}};
            outer.enter();
            {
                scoped_config inner{provider, user_config_map{{"name", "inner"}}};
                inner.enter();
                CHECK(provider.read().at("name") == "inner");
            }
            CHECK(provider.has_override());
            CHECK(provider.read().at("name") == "outer");
        }
        CHECK_FALSE(provider.has_override());
        CHECK(provider.read().at("name") == "disk");
    }

    TEST_CASE("006: nested guards of one kind unwind to the enclosing value", "[006][guards][nested]") {
        SECTION("environment variable set twice") {
            detail::scoped_env_var cleared{"LITMUS_GUARD_NESTED", std::nullopt};
            {
                scoped_env outer{env_overlay{{"LITMUS_GUARD_NESTED", "outer"}}};
                outer.enter();
                {
                    scoped_env inner{env_overlay{{"LITMUS_GUARD_NESTED", "inner"}}};
                    inner.enter();
                    CHECK(detail::env_value("LITMUS_GUARD_NESTED") == "inner");
                }
                CHECK(detail::env_value("LITMUS_GUARD_NESTED") == "outer");
            }
            CHECK_FALSE(detail::env_value("LITMUS_GUARD_NESTED"));
        }

        SECTION("search path prepended twice") {
            std::vector<std::filesystem::path> search{"/base"};
            {
                scoped_search_path outer{search, std::nullopt, {"/outer"}};
                outer.enter();
                {
                    scoped_search_path inner{search, std::nullopt, {"/inner"}};
                    inner.enter();
                    CHECK(search == std::vector<std::filesystem::path>{"/inner", "/outer", "/base"});
                }
                CHECK(search == std::vector<std::filesystem::path>{"/outer", "/base"});
            }
            CHECK(search == std::vector<std::filesystem::path>{"/base"});
        }

        SECTION("model path replaced twice") {
            std::vector<std::filesystem::path> models{"/models"};
            {
                scoped_model_path outer{models, {"/outer"}};
                outer.enter();
                {
                    scoped_model_path inner{models, {"/inner", "/extra"}};
                    inner.enter();
                    CHECK(models == std::vector<std::filesystem::path>{"/inner", "/extra"});
                }
                CHECK(models == std::vector<std::filesystem::path>{"/outer"});
            }
            CHECK(models == std::vector<std::filesystem::path>{"/models"});
        }

        SECTION("working directory changed twice") {
            detail::temp_dir dir{"litmus_cwd_nested"};
            std::filesystem::create_directories(dir.path / "inner");
            auto before = std::filesystem::current_path();
            {
                scoped_cwd outer{dir.path};
                outer.enter();
                {
                    scoped_cwd inner{dir.path / "inner"};
                    inner.enter();
                    CHECK(std::filesystem::equivalent(std::filesystem::current_path(), dir.path / "inner"));
                }
                CHECK(std::filesystem::equivalent(std::filesystem::current_path(), dir.path));
            }
            CHECK(std::filesystem::current_path() == before);
        }
    }

    TEST_CASE("006: temporary file guard", "[006][guards][tempfile]") {
        std::filesystem::path created{};
        {
            scoped_temp_file temp{"litmus-guard-", ".txt"};
            CHECK(temp.path().empty());
            temp.enter();
            created = temp.path();
            CHECK(std::filesystem::is_regular_file(created));
            CHECK(created.filename().string().starts_with("litmus-guard-"));
            CHECK(created.extension() == ".txt");
        }
        CHECK_FALSE(std::filesystem::exists(created));

        {
            scoped_temp_file kept{"litmus-kept-", "", true};
            kept.enter();
            created = kept.path();
        }
        CHECK(std::filesystem::exists(created));
        std::filesystem::remove(created);
    }

    TEST_CASE("006: config provider handles missing and malformed files", "[006][guards][config]") {
        detail::temp_dir dir{"litmus_config_bad"};

        config_provider missing{dir.path / "absent.json"};
        CHECK(missing.read().empty());

        detail::write_text_file(dir.path / "bad.json", "{not json");
        config_provider malformed{dir.path / "bad.json"};
        CHECK_THROWS_AS(malformed.read(), std::runtime_error);
    }

    TEST_CASE("006: stderr capture diverts the diagnostic sink", "[006][guards][stderr]") {
        std::ostringstream real{};
        std::ostream* sink = &real;

        scoped_stderr_capture capture{sink};
        capture.enter();
        *sink << "captured line\n";
        capture.exit();
        *sink << "after\n";

        CHECK(capture.captured() == "captured line\n");
        CHECK(real.str() == "after\n");

        std::ostringstream printed{};
        capture.print(printed);
        CHECK(printed.str() == "captured line\n");
    }

}  // namespace litmus::test
