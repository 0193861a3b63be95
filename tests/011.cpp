#include "utils.hpp"

namespace litmus::test {
    using namespace std::string_view_literals;

    TEST_CASE("011: builtin names are sorted and installed", "[011][builtins]") {
        auto names = script::builtin_names();
        CHECK(std::ranges::is_sorted(names));
        CHECK(std::ranges::binary_search(names, std::string{"Project"}));
        CHECK(std::ranges::binary_search(names, std::string{"include"}));

        script::symbol_table table{};
        script::install_builtins(table);
        CHECK(table.size() == names.size());
        CHECK(table.names() == names);
    }

    TEST_CASE("011: print and formatting builtins", "[011][builtins][print]") {
        detail::script_session session{};

        CHECK(session.eval("print(1, \"a\", [2], sep=\"|\")") == "1|a|[2]\n");
        CHECK(session.eval("str(\"x\"); repr(\"x\")") == "\"x\"\n\"\\\"x\\\"\"\n");
        CHECK(session.eval("sorted([\"b\", \"a\"], reverse=true)") == "[\"b\", \"a\"]\n");
        CHECK(session.eval("len(\"abc\")") == "3\n");
        CHECK(session.eval("pprint({\"a\": 1})") == "{\"a\": 1}\n");
        CHECK(session.eval("len(3)") == "type_error: int has no length\n");

        auto wide = session.eval("pprint([\"" + std::string(40, 'x') + "\", \"" + std::string(40, 'y') + "\"])");
        CHECK(wide == "[\"" + std::string(40, 'x') + "\",\n \"" + std::string(40, 'y') + "\"]\n");
    }

    TEST_CASE("011: file builtins read and write under a directory", "[011][builtins][files]") {
        detail::temp_dir dir{"litmus_builtins_files"};
        detail::script_session session{};
        session.names.assign("root", script::value{dir.path.string()});

        CHECK(session.eval("find(root)") == "<empty>\n");
        CHECK(session.eval("mkdir(path(root, \"a\", \"b\"))\nwrite(path(root, \"a\", \"b\", \"f.txt\"), \"hi\")").empty());
        CHECK(session.eval("write(path(root, \"top.txt\"), \"one\\n\")\nwrite(path(root, \"top.txt\"), \"two\\n\", append=true)").empty());
        CHECK(session.eval("find(root)") == "a/b/f.txt\ntop.txt\n");
        CHECK(session.eval("find2(root)") == "[\"a/b/f.txt\", \"top.txt\"]\n");
        CHECK(session.eval("cat(root, \"a\", \"b\", \"f.txt\")") == "hi\n");
        CHECK(session.eval("cat(root, \"top.txt\")") == "one\ntwo\n");
        CHECK(session.eval("touch(path(root, \"empty.log\"))\ndir(root, ignore=[\"*.log\"])") == "[\"a\", \"top.txt\"]\n");
        CHECK(session.eval("exists(path(root, \"empty.log\")); basename(path(root, \"top.txt\"))") == "true\n\"top.txt\"\n");
        CHECK(session.eval("sha256(path(root, \"a\", \"b\", \"f.txt\"))") ==
              "\"8f434346648f6b96df89dda901c5176b10a6d83961dd3c1ac88b59b2dc327aa4\"\n");

        auto missing = session.eval("cat(root, \"nope.txt\")");
        CHECK(missing.starts_with("os_error: no such file '"));

        CHECK(session.eval("copytree(path(root, \"a\"), path(root, \"copy\"))\nfind(path(root, \"copy\"))") == "b/f.txt\n");
        CHECK(session.eval("copytree(path(root, \"a\"), path(root, \"copy\"))").starts_with("os_error: destination exists"));
        CHECK(session.eval("symlink(path(root, \"top.txt\"), path(root, \"link\"))\ncompare_paths(path(root, \"link\"), path(root, \"top.txt\"))") ==
              "true\n");
    }

    TEST_CASE("011: include evaluates scripts from the search path", "[011][builtins][include]") {
        detail::temp_dir dir{"litmus_builtins_include"};
        detail::write_text_file(dir.path / "first" / "helpers.lit", "greeting = \"hello\"\nprint(\"loaded\")\n");
        detail::write_text_file(dir.path / "second" / "helpers.lit", "greeting = \"shadowed\"\n");
        detail::write_text_file(dir.path / "second" / "extra.lit", "extra = 1\n");

        detail::script_session session{"/nonexistent/config.json", {dir.path / "first", dir.path / "second"}};

        CHECK(session.eval("include(\"helpers\")\ngreeting") == "loaded\n\"hello\"\n");
        CHECK(session.eval("include(\"extra.lit\")\nextra") == "1\n");
        CHECK(session.eval("include(\"absent\")") == "os_error: no script named 'absent' on the search path\n");

        SECTION("SysPath guard changes the lookup for its scope") {
            CHECK(session.eval("with SysPath(prepend=[\"" + (dir.path / "second").string() + "\"]) {\n    include(\"helpers\")\n}\ngreeting") ==
                  "\"shadowed\"\n");
            CHECK(session.eval("len(sys_path())") == "2\n");
        }
    }

    TEST_CASE("011: user config and samples are reachable", "[011][builtins][env]") {
        detail::temp_dir dir{"litmus_builtins_env"};
        detail::write_text_file(dir.path / "config.json", R"({"user": "alice"})");
        std::filesystem::create_directories(dir.path / "samples");

        detail::script_session session{dir.path / "config.json", {}, dir.path / "samples"};

        CHECK(session.eval("user_config()") == "{\"user\": \"alice\"}\n");
        CHECK(session.eval("with UserConfig({\"user\": \"bob\"}) { print(user_config()[\"user\"]) }\nuser_config()[\"user\"]") ==
              "bob\n\"alice\"\n");
        CHECK(session.eval("sample(\"projects\", \"demo\") == path(samples_dir(), \"projects\", \"demo\")") == "true\n");

        detail::script_session bare{};
        CHECK(bare.eval("samples_dir()") == "os_error: no samples directory is configured\n");
    }

    TEST_CASE("011: Env and Chdir guards are visible to builtins", "[011][builtins][guards]") {
        detail::temp_dir dir{"litmus_builtins_guards"};
        detail::scoped_env_var cleared{"LITMUS_BUILTIN_VAR", std::nullopt};
        detail::script_session session{};
        session.names.assign("root", script::value{dir.path.string()});

        CHECK(session.eval("with Env({\"LITMUS_BUILTIN_VAR\": 5}) { print(getenv(\"LITMUS_BUILTIN_VAR\")) }") == "5\n");
        CHECK(session.eval("getenv(\"LITMUS_BUILTIN_VAR\")").empty());
        CHECK(session.eval("with Chdir(root) { print(compare_paths(cwd(), root)) }") == "true\n");
        CHECK(session.eval("with Chdir(path(root, \"missing\")) { print(1) }").starts_with("error: failed to change directory"));
    }

    TEST_CASE("011: ModelPath and TempFile guards", "[011][builtins][guards]") {
        detail::script_session session{};

        SECTION("ModelPath replaces the model path for its scope") {
            CHECK(session.eval("model_path()") == "[]\n");
            CHECK(session.eval("with ModelPath([\"/models/a\", \"/models/b\"]) { print(model_path()) }") ==
                  "[\"/models/a\", \"/models/b\"]\n");
            CHECK(session.eval("with ModelPath(\"/models/c\") { print(len(model_path())) }") == "1\n");
            CHECK(session.eval("model_path()") == "[]\n");
        }

        SECTION("TempFile exists only inside its block") {
            CHECK(session.eval("print(TempFile().path)") == "none\n");
            CHECK(session.eval("with TempFile(suffix=\".txt\") as tmp {\n    print(exists(tmp.path))\n}") == "true\n");
            CHECK(session.eval("tmp.path.endswith(\".txt\"); exists(tmp.path)") == "true\nfalse\n");
        }

        SECTION("TempFile can be kept") {
            CHECK(session.eval("with TempFile(keep=true) as kept { print(1) }") == "1\n");
            auto kept = session.names.lookup("kept");
            REQUIRE(kept);
            auto file = kept->as_object()->get_attr("path");
            REQUIRE(file);
            CHECK(std::filesystem::exists(file->as_string()));
            std::filesystem::remove(file->as_string());
        }
    }

    TEST_CASE("011: Proxy objects hold assigned attributes", "[011][builtins][proxy]") {
        detail::script_session session{};

        CHECK(session.eval("p = Proxy()\np") == "<Proxy>\n");
        CHECK(session.eval("p.name = \"demo\"\np.count = 2\np") == "<Proxy count=2 name=\"demo\">\n");
        CHECK(session.eval("p.missing").starts_with("attribute_error: "));
    }

}  // namespace litmus::test
