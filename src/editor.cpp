#include "editor.hpp"

#include "litmus/builtins.hpp"

extern "C" {
#include <isocline.h>
}

#include <filesystem>
#include <string_view>
#include <vector>

namespace litmus::cli { namespace detail {

    using namespace std::string_view_literals;

    static const char* command_completions[] = {":help", ":names", ":reset", ":show", ":quit", ":q", nullptr};

    // nullptr-terminated view over the builtin names, built once.
    static const char** builtin_completions() {
        static const std::vector<std::string> names = script::builtin_names();
        static const std::vector<const char*> table = [] {
            std::vector<const char*> out{};
            out.reserve(names.size() + 1U);
            for (const auto& name : names) {
                out.push_back(name.c_str());
            }
            out.push_back(nullptr);
            return out;
        }();
        return const_cast<const char**>(table.data());
    }

    static constexpr std::string_view trim_left(std::string_view value) {
        auto start = value.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos) {
            return {};
        }
        return value.substr(start);
    }

    static bool is_command_char(const char* s, long len) {
        if (len == 1 && s[0] == ':') {
            return true;
        }
        return ic_char_is_idletter(s, len);
    }

    static void complete_commands(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, command_completions);
    }

    static void complete_builtins(ic_completion_env_t* cenv, const char* prefix) {
        (void)ic_add_completions(cenv, prefix, builtin_completions());
    }

    static void complete_repl(ic_completion_env_t* cenv, const char* prefix) {
        if (prefix == nullptr) {
            return;
        }

        auto trimmed = trim_left(std::string_view{prefix});
        if (trimmed.starts_with(':')) {
            ic_complete_word(cenv, prefix, complete_commands, is_command_char);
            return;
        }
        ic_complete_word(cenv, prefix, complete_builtins, nullptr);
    }

}}  // namespace litmus::cli::detail

namespace litmus::cli {

    namespace fs = std::filesystem;

    line_editor::line_editor(const startup_config& cfg) {
        ic_enable_multiline(true);
        ic_enable_multiline_indent(true);
        ic_enable_history_duplicates(false);
        ic_set_prompt_marker("", "");
        ic_set_default_completer(detail::complete_repl, nullptr);

        if (!cfg.history_enabled) {
            ic_set_history(nullptr, 1000);
            return;
        }

        std::error_code ec{};
        auto history_parent = cfg.history_file.parent_path();
        if (!history_parent.empty()) {
            fs::create_directories(history_parent, ec);
        }

        auto history_file = cfg.history_file.string();
        ic_set_history(history_file.c_str(), 1000);
    }

    std::optional<std::string> line_editor::read_line(std::string_view prompt) {
        auto prompt_text = std::string(prompt);
        auto* raw = ic_readline(prompt_text.c_str());
        if (raw == nullptr) {
            return std::nullopt;
        }

        std::string line{raw};
        ic_free(raw);
        return line;
    }

    void line_editor::record_history(std::string_view line) {
        auto entry = std::string(line);
        ic_history_add(entry.c_str());
    }

}  // namespace litmus::cli
