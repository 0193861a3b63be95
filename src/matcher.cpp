#include "litmus/matcher.hpp"

#include <regex>
#include <string>
#include <vector>

namespace litmus {

    namespace detail {

        static constexpr auto ellipsis_marker = "..."sv;
        static constexpr auto ellipsis_escape = "???"sv;
        static constexpr auto blankline_marker = "<BLANKLINE>"sv;
        static constexpr auto capture_open = "{{"sv;
        static constexpr auto capture_close = "}}"sv;

        enum class segment_kind : uint8_t { literal, wildcard, capture };

        struct segment {
            segment_kind kind{segment_kind::literal};
            std::string text{};
        };

        struct pattern_line {
            bool spans_lines{false};
            std::vector<segment> segments{};
        };

        using binding_map = std::map<std::string, std::string>;

        template <typename Fn>
        static std::string transform_lines(std::string_view text, Fn&& fn) {
            std::string out{};
            out.reserve(text.size());
            size_t begin = 0U;
            while (begin < text.size()) {
                auto end = text.find('\n', begin);
                auto has_newline = end != std::string_view::npos;
                auto line = text.substr(begin, (has_newline ? end : text.size()) - begin);
                out += fn(line);
                if (!has_newline) {
                    break;
                }
                out.push_back('\n');
                begin = end + 1U;
            }
            return out;
        }

        static bool is_capture_name(std::string_view name) {
            if (name.empty() || !utils::is_identifier_start(name.front())) {
                return false;
            }
            return std::ranges::all_of(name, utils::is_identifier_char);
        }

        static void push_segment(std::vector<segment>& out, segment_kind kind, std::string text = {}) {
            // adjacent wildcards are equivalent to one
            if (kind == segment_kind::wildcard && !out.empty() && out.back().kind == segment_kind::wildcard) {
                return;
            }
            out.push_back(segment{kind, std::move(text)});
        }

        static pattern_line compile_line(std::string_view line, bool ellipsis) {
            pattern_line compiled{};
            if (ellipsis && utils::trim_view(line) == ellipsis_marker) {
                compiled.spans_lines = true;
                return compiled;
            }

            std::string literal{};
            auto flush_literal = [&]() {
                if (!literal.empty()) {
                    push_segment(compiled.segments, segment_kind::literal, std::move(literal));
                    literal.clear();
                }
            };

            size_t i = 0U;
            while (i < line.size()) {
                auto rest = line.substr(i);
                if (ellipsis && rest.starts_with(ellipsis_marker)) {
                    flush_literal();
                    push_segment(compiled.segments, segment_kind::wildcard);
                    i += ellipsis_marker.size();
                    continue;
                }
                if (rest.starts_with(capture_open)) {
                    auto close = rest.find(capture_close, capture_open.size());
                    if (close != std::string_view::npos) {
                        auto name = rest.substr(capture_open.size(), close - capture_open.size());
                        if (is_capture_name(name)) {
                            flush_literal();
                            push_segment(compiled.segments, segment_kind::capture, std::string{name});
                            i += close + capture_close.size();
                            continue;
                        }
                    }
                }
                literal.push_back(line[i]);
                ++i;
            }
            flush_literal();
            return compiled;
        }

        static std::optional<std::string_view> bound_value(
                const std::string& name, const binding_map& local, const capture_table& captures) {
            if (auto it = local.find(name); it != local.end()) {
                return std::string_view{it->second};
            }
            return captures.lookup(name);
        }

        static bool match_segments(
                const std::vector<segment>& segments,
                size_t index,
                std::string_view text,
                size_t pos,
                binding_map& bindings,
                const capture_table& captures) {
            if (index == segments.size()) {
                return pos == text.size();
            }

            const auto& seg = segments[index];
            switch (seg.kind) {
                case segment_kind::literal:
                    if (!text.substr(pos).starts_with(seg.text)) {
                        return false;
                    }
                    return match_segments(segments, index + 1U, text, pos + seg.text.size(), bindings, captures);

                case segment_kind::wildcard:
                    // shortest span first
                    for (auto end = pos; end <= text.size(); ++end) {
                        if (match_segments(segments, index + 1U, text, end, bindings, captures)) {
                            return true;
                        }
                    }
                    return false;

                case segment_kind::capture:
                    if (auto existing = bound_value(seg.text, bindings, captures)) {
                        if (!text.substr(pos).starts_with(*existing)) {
                            return false;
                        }
                        return match_segments(segments, index + 1U, text, pos + existing->size(), bindings, captures);
                    }
                    for (auto end = pos + 1U; end <= text.size(); ++end) {
                        auto trial = bindings;
                        trial[seg.text] = std::string{text.substr(pos, end - pos)};
                        if (match_segments(segments, index + 1U, text, end, trial, captures)) {
                            bindings = std::move(trial);
                            return true;
                        }
                    }
                    return false;
            }
            return false;
        }

        static bool match_lines(
                const std::vector<pattern_line>& pattern,
                size_t pattern_index,
                const std::vector<std::string>& lines,
                size_t line_index,
                binding_map& bindings,
                const capture_table& captures) {
            if (pattern_index == pattern.size()) {
                return line_index == lines.size();
            }

            const auto& current = pattern[pattern_index];
            if (current.spans_lines) {
                // greedy: prefer consuming as many whole lines as still lets the tail align
                for (auto take = lines.size() - line_index + 1U; take-- > 0U;) {
                    auto trial = bindings;
                    if (match_lines(pattern, pattern_index + 1U, lines, line_index + take, trial, captures)) {
                        bindings = std::move(trial);
                        return true;
                    }
                }
                return false;
            }

            if (line_index == lines.size()) {
                return false;
            }

            auto trial = bindings;
            if (!match_segments(current.segments, 0U, lines[line_index], 0U, trial, captures)) {
                return false;
            }
            if (!match_lines(pattern, pattern_index + 1U, lines, line_index + 1U, trial, captures)) {
                return false;
            }
            bindings = std::move(trial);
            return true;
        }

    }  // namespace detail

    std::optional<std::string_view> capture_table::lookup(std::string_view name) const {
        if (auto it = values_.find(name); it != values_.end()) {
            return std::string_view{it->second};
        }
        return std::nullopt;
    }

    void capture_table::bind(std::string name, std::string value) {
        values_.insert_or_assign(std::move(name), std::move(value));
    }

    void capture_table::merge(const std::map<std::string, std::string>& bindings) {
        for (const auto& [name, value] : bindings) {
            if (!values_.contains(name)) {
                values_.emplace(name, value);
            }
        }
    }

    std::string normalize_want(std::string_view want) {
        return detail::transform_lines(want, [](std::string_view line) {
            if (utils::trim_view(line) == detail::blankline_marker) {
                return std::string{};
            }
            if (line.starts_with(detail::ellipsis_escape)) {
                return std::string{detail::ellipsis_marker} + std::string{line.substr(detail::ellipsis_escape.size())};
            }
            return std::string{line};
        });
    }

    std::string strip_u_prefixes(std::string_view text) {
        static const std::regex inner_single{R"(([\W])u'(.*?)')"};
        static const std::regex inner_double{R"re(([\W])u"(.*?)")re"};
        static const std::regex leading_single{R"(^u'(.*?)')"};
        static const std::regex leading_double{R"re(^u"(.*?)")re"};

        auto out = std::string{text};
        out = std::regex_replace(out, inner_single, "$1'$2'");
        out = std::regex_replace(out, inner_double, "$1\"$2\"");
        out = std::regex_replace(out, leading_single, "'$1'");
        out = std::regex_replace(out, leading_double, "\"$1\"");
        return out;
    }

    std::string strip_long_suffixes(std::string_view text) {
        static const std::regex long_literal{R"(([0-9]+)L)"};
        return std::regex_replace(std::string{text}, long_literal, "$1");
    }

    std::string normalize_path_separators(std::string_view text) {
        static const std::regex separators{R"([c-zC-Z]:\\\\?|\\\\?)"};
        return std::regex_replace(std::string{text}, separators, "/");
    }

    std::string collapse_whitespace(std::string_view text) {
        std::vector<std::string> lines{};
        for (const auto& raw : utils::split_lines(text)) {
            std::string line{};
            bool pending_space = false;
            for (auto c : raw) {
                if (utils::is_blank(c)) {
                    pending_space = !line.empty();
                    continue;
                }
                if (pending_space) {
                    line.push_back(' ');
                    pending_space = false;
                }
                line.push_back(c);
            }
            lines.push_back(std::move(line));
        }
        while (!lines.empty() && lines.back().empty()) {
            lines.pop_back();
        }
        if (lines.empty()) {
            return {};
        }
        return utils::join_with_separator(lines, "\n"sv) + '\n';
    }

    std::string normalize_got(std::string_view got, option_flags flags) {
        auto out = std::string{got};
        if (flags.has(option_flag::strip_u)) {
            out = strip_u_prefixes(out);
        }
        if (flags.has(option_flag::strip_l)) {
            out = strip_long_suffixes(out);
        }
        if (flags.has(option_flag::normalize_paths)) {
            out = normalize_path_separators(out);
        }
        return out;
    }

    std::string strip_error_module(std::string_view line) {
        auto is_qualified_name = [](std::string_view name) {
            return !name.empty() && std::ranges::all_of(name, [](char c) { return utils::is_identifier_char(c) || c == ':'; });
        };
        auto unqualified = [](std::string_view name) {
            if (auto pos = name.rfind("::"sv); pos != std::string_view::npos) {
                return name.substr(pos + 2U);
            }
            return name;
        };

        auto sep = line.find(": "sv);
        if (sep == std::string_view::npos) {
            auto trimmed = utils::trim_newlines(line);
            if (is_qualified_name(trimmed)) {
                return std::string{unqualified(trimmed)} + std::string{line.substr(trimmed.size())};
            }
            return std::string{line};
        }

        auto head = line.substr(0U, sep);
        if (!is_qualified_name(head)) {
            return std::string{line};
        }
        return std::string{unqualified(head)} + std::string{line.substr(sep)};
    }

    match_result check_output(std::string_view want, std::string_view got, option_flags flags, const capture_table& captures) {
        match_result result{};
        result.want = normalize_want(want);
        result.got = normalize_got(got, flags);
        if (flags.has(option_flag::normalize_whitespace)) {
            result.want = collapse_whitespace(result.want);
            result.got = collapse_whitespace(result.got);
        }

        auto want_lines = utils::split_lines(result.want);
        auto got_lines = utils::split_lines(result.got);

        if (want_lines.empty()) {
            result.matched = got_lines.empty();
            return result;
        }

        auto ellipsis = flags.has(option_flag::ellipsis);
        std::vector<detail::pattern_line> pattern{};
        pattern.reserve(want_lines.size());
        for (const auto& line : want_lines) {
            pattern.push_back(detail::compile_line(line, ellipsis));
        }

        detail::binding_map bindings{};
        result.matched = detail::match_lines(pattern, 0U, got_lines, 0U, bindings, captures);
        if (result.matched) {
            result.bindings = std::move(bindings);
        }
        return result;
    }

}  // namespace litmus
