#pragma once

#include <algorithm>
#include <charconv>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace litmus {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << "[litmus " << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr bool is_blank(char c) {
            return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        constexpr std::string_view trim_newlines(std::string_view value) {
            while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
                value.remove_suffix(1U);
            }
            return value;
        }

        // Splits on '\n'; a single trailing newline does not produce an empty last line.
        inline std::vector<std::string> split_lines(std::string_view text) {
            std::vector<std::string> lines{};
            if (text.empty()) {
                return lines;
            }
            size_t begin = 0U;
            while (begin < text.size()) {
                auto end = text.find('\n', begin);
                if (end == std::string_view::npos) {
                    lines.emplace_back(text.substr(begin));
                    break;
                }
                lines.emplace_back(text.substr(begin, end - begin));
                begin = end + 1U;
            }
            return lines;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        template <typename T>
            requires std::integral<T>
        constexpr std::optional<T> parse_integer(std::string_view input, int base = 10) {
            T value{};
            auto result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }
            return {value};
        }

        constexpr bool is_identifier_start(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        }

        constexpr bool is_identifier_char(char c) {
            return is_identifier_start(c) || (c >= '0' && c <= '9');
        }

    }  // namespace utils

}  // namespace litmus
