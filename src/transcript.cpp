#include "litmus/transcript.hpp"

#include "litmus/format.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace litmus::literals;

namespace litmus {

    namespace fs = std::filesystem;

    namespace detail {

        static constexpr auto prompt_marker = ">>>"sv;
        static constexpr auto continuation_marker = "..."sv;
        static constexpr auto fence_marker = "```"sv;
        static constexpr auto inline_directive = "# litmus:"sv;
        static constexpr auto options_directive = "litmus-options"sv;

        struct platform_directive {
            std::string_view key;
            platform_kind platform;
        };

        static constexpr platform_directive platform_directives[] = {
                {"skip-windows"sv, platform_kind::windows},
                {"skip-linux"sv, platform_kind::gnu_linux},
                {"skip-macos"sv, platform_kind::macos}};

        // Offset of the '#' opening a comment, skipping string literals; npos when none.
        static std::size_t comment_start(std::string_view line) {
            char quote = '\0';
            for (std::size_t i = 0U; i < line.size(); ++i) {
                auto c = line[i];
                if (quote != '\0') {
                    if (c == '\\') {
                        ++i;
                    }
                    else if (c == quote) {
                        quote = '\0';
                    }
                    continue;
                }
                if (c == '"' || c == '\'') {
                    quote = c;
                }
                else if (c == '#') {
                    return i;
                }
            }
            return std::string_view::npos;
        }

        static std::size_t leading_spaces(std::string_view line) {
            auto pos = line.find_first_not_of(' ');
            return pos == std::string_view::npos ? line.size() : pos;
        }

        // `marker` at `indent`, followed by a space or end of line
        static bool has_marker(std::string_view line, std::size_t indent, std::string_view marker) {
            if (leading_spaces(line) != indent) {
                return false;
            }
            auto body = line.substr(indent);
            if (!body.starts_with(marker)) {
                return false;
            }
            return body.size() == marker.size() || body[marker.size()] == ' ';
        }

        static std::string_view after_marker(std::string_view line, std::size_t indent, std::string_view marker) {
            auto body = line.substr(indent + marker.size());
            if (!body.empty()) {
                body.remove_prefix(1U);
            }
            return body;
        }

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                throw std::runtime_error("failed to open {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read {}"_format(path.string()));
            }
            return ss.str();
        }

    }  // namespace detail

    bool head_directives::skips(platform_kind platform) const {
        return std::ranges::find(skip_platforms, platform) != skip_platforms.end();
    }

    option_overrides parse_option_list(std::string_view text, std::string_view origin, std::size_t line) {
        option_overrides out{};
        std::size_t pos = 0U;
        while (pos < text.size()) {
            auto start = text.find_first_not_of(" \t,", pos);
            if (start == std::string_view::npos) {
                break;
            }
            auto end = text.find_first_of(" \t,", start);
            auto token = text.substr(start, (end == std::string_view::npos ? text.size() : end) - start);
            pos = end == std::string_view::npos ? text.size() : end;

            if (token.size() < 2U || (token.front() != '+' && token.front() != '-')) {
                throw std::runtime_error("{}:{}: invalid option directive '{}'"_format(origin, line + 1U, token));
            }
            option_flag flag{};
            if (!try_parse_option_flag(token.substr(1U), flag)) {
                throw std::runtime_error(
                        "{}:{}: unknown option flag '{}'"_format(origin, line + 1U, token.substr(1U)));
            }
            out.settings.insert_or_assign(flag, token.front() == '+');
        }
        return out;
    }

    head_directives parse_head_directives(std::string_view text) {
        head_directives head{};
        auto window = text.substr(0U, std::min(text.size(), head_directive_window));
        auto lines = utils::split_lines(window);
        for (std::size_t i = 0U; i < lines.size(); ++i) {
            auto trimmed = utils::trim_view(lines[i]);
            auto colon = trimmed.find(':');
            if (colon == std::string_view::npos) {
                continue;
            }
            auto key = utils::trim_view(trimmed.substr(0U, colon));
            auto value = utils::trim_view(trimmed.substr(colon + 1U));

            if (utils::str_case_eq(key, detail::options_directive)) {
                auto parsed = parse_option_list(value, "<head>"sv, i);
                for (const auto& [flag, enabled] : parsed.settings) {
                    head.options.settings.insert_or_assign(flag, enabled);
                }
                continue;
            }
            for (const auto& directive : detail::platform_directives) {
                if (utils::str_case_eq(key, directive.key) && utils::str_case_eq(value, "yes"sv)) {
                    head.skip_platforms.push_back(directive.platform);
                }
            }
        }
        return head;
    }

    std::vector<example> parse_examples(std::string_view text, std::string_view origin) {
        std::vector<example> examples{};
        auto lines = utils::split_lines(text);

        std::size_t i = 0U;
        while (i < lines.size()) {
            std::string_view line = lines[i];
            auto indent = detail::leading_spaces(line);
            if (!detail::has_marker(line, indent, detail::prompt_marker)) {
                ++i;
                continue;
            }

            example ex{};
            ex.line = i;
            ex.indent = indent;

            std::vector<std::string> source_lines{};
            source_lines.emplace_back(detail::after_marker(line, indent, detail::prompt_marker));
            ++i;
            while (i < lines.size() && detail::has_marker(lines[i], indent, detail::continuation_marker)) {
                source_lines.emplace_back(detail::after_marker(lines[i], indent, detail::continuation_marker));
                ++i;
            }

            std::vector<std::string> want_lines{};
            while (i < lines.size()) {
                std::string_view candidate = lines[i];
                if (utils::trim_view(candidate).empty()) {
                    break;
                }
                if (detail::leading_spaces(candidate) < indent) {
                    break;
                }
                auto body = candidate.substr(indent);
                if (detail::has_marker(candidate, indent, detail::prompt_marker) ||
                    utils::trim_view(body).starts_with(detail::fence_marker)) {
                    break;
                }
                want_lines.emplace_back(body);
                ++i;
            }

            for (std::size_t k = 0U; k < source_lines.size(); ++k) {
                std::string_view line{source_lines[k]};
                auto pos = detail::comment_start(line);
                if (pos == std::string_view::npos || !line.substr(pos).starts_with(detail::inline_directive)) {
                    continue;
                }
                auto directive_text = line.substr(pos + detail::inline_directive.size());
                auto parsed = parse_option_list(directive_text, origin, ex.line + k);
                if (parsed.settings.contains(option_flag::report_only_first_failure)) {
                    throw std::runtime_error("{}:{}: {} applies to a whole file, not a single example"_format(
                            origin, ex.line + k + 1U, to_string(option_flag::report_only_first_failure)));
                }
                for (const auto& [flag, enabled] : parsed.settings) {
                    ex.options.settings.insert_or_assign(flag, enabled);
                }
            }

            ex.source = utils::join_with_separator(source_lines, "\n"sv);
            if (!want_lines.empty()) {
                ex.want = utils::join_with_separator(want_lines, "\n"sv) + '\n';
            }
            examples.push_back(std::move(ex));
        }
        return examples;
    }

    std::vector<std::string> all_tests(const fs::path& root) {
        std::error_code ec{};
        if (!fs::is_directory(root, ec) || ec) {
            throw std::runtime_error("tests directory not found: {}"_format(root.string()));
        }

        std::vector<std::string> names{};
        for (const auto& entry : fs::directory_iterator(root, ec)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            if (entry.path().extension() == transcript_extension) {
                names.push_back(entry.path().stem().string());
            }
        }
        if (ec) {
            throw std::runtime_error("failed to enumerate {}"_format(root.string()));
        }
        std::ranges::sort(names);
        return names;
    }

    fs::path transcript_path(const fs::path& root, std::string_view name) {
        return root / (std::string{name} + std::string{transcript_extension});
    }

    transcript_file load_transcript(const fs::path& root, std::string_view name) {
        auto path = transcript_path(root, name);
        std::error_code ec{};
        if (!fs::is_regular_file(path, ec) || ec) {
            throw transcript_not_found{std::string{name}};
        }

        transcript_file file{};
        file.name = std::string{name};
        file.path = path;
        file.text = detail::read_text_file(path);
        file.head = parse_head_directives(file.text);
        file.examples = parse_examples(file.text, path.string());
        return file;
    }

    std::vector<transcript_file> discover(const fs::path& root) {
        std::vector<transcript_file> files{};
        for (const auto& name : all_tests(root)) {
            files.push_back(load_transcript(root, name));
        }
        return files;
    }

}  // namespace litmus
