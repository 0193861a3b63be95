#pragma once

#include "utils.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace litmus {

    using namespace std::string_view_literals;

    enum class option_flag : uint16_t {
        ellipsis = 1U << 0U,
        normalize_whitespace = 1U << 1U,
        normalize_paths = 1U << 2U,
        strip_u = 1U << 3U,
        strip_l = 1U << 4U,
        windows = 1U << 5U,
        skip = 1U << 6U,
        report_only_first_failure = 1U << 7U,
    };

    inline constexpr std::string_view to_string(option_flag flag) {
        switch (flag) {
            case option_flag::ellipsis:
                return "ELLIPSIS"sv;
            case option_flag::normalize_whitespace:
                return "NORMALIZE_WHITESPACE"sv;
            case option_flag::normalize_paths:
                return "NORMALIZE_PATHS"sv;
            case option_flag::strip_u:
                return "STRIP_U"sv;
            case option_flag::strip_l:
                return "STRIP_L"sv;
            case option_flag::windows:
                return "WINDOWS"sv;
            case option_flag::skip:
                return "SKIP"sv;
            case option_flag::report_only_first_failure:
                return "REPORT_ONLY_FIRST_FAILURE"sv;
        }
        return "ELLIPSIS"sv;
    }

    inline constexpr bool try_parse_option_flag(std::string_view text, option_flag& out) {
        constexpr option_flag all[] = {
                option_flag::ellipsis,
                option_flag::normalize_whitespace,
                option_flag::normalize_paths,
                option_flag::strip_u,
                option_flag::strip_l,
                option_flag::windows,
                option_flag::skip,
                option_flag::report_only_first_failure};
        for (auto flag : all) {
            if (utils::str_case_eq(text, to_string(flag))) {
                out = flag;
                return true;
            }
        }
        return false;
    }

    class option_flags {
      public:
        constexpr option_flags() = default;
        constexpr option_flags(option_flag flag) : bits_{static_cast<uint16_t>(flag)} {}

        constexpr bool has(option_flag flag) const { return (bits_ & static_cast<uint16_t>(flag)) != 0U; }

        constexpr option_flags& set(option_flag flag, bool enabled = true) {
            if (enabled) {
                bits_ |= static_cast<uint16_t>(flag);
            }
            else {
                bits_ &= static_cast<uint16_t>(~static_cast<uint16_t>(flag));
            }
            return *this;
        }

        constexpr option_flags operator|(option_flags other) const {
            option_flags out{};
            out.bits_ = bits_ | other.bits_;
            return out;
        }

        constexpr bool operator==(const option_flags&) const = default;

        constexpr uint16_t bits() const { return bits_; }

      private:
        uint16_t bits_{0U};
    };

    constexpr option_flags operator|(option_flag lhs, option_flag rhs) {
        return option_flags{lhs} | option_flags{rhs};
    }

    // Explicit +FLAG / -FLAG settings layered over a base set.
    struct option_overrides {
        std::map<option_flag, bool> settings{};

        option_flags apply(option_flags base) const {
            for (const auto& [flag, enabled] : settings) {
                base.set(flag, enabled);
            }
            return base;
        }
    };

    class capture_table {
      public:
        std::optional<std::string_view> lookup(std::string_view name) const;
        void bind(std::string name, std::string value);
        void merge(const std::map<std::string, std::string>& bindings);
        void clear() { values_.clear(); }
        bool empty() const { return values_.empty(); }
        const std::map<std::string, std::string, std::less<>>& values() const { return values_; }

      private:
        std::map<std::string, std::string, std::less<>> values_{};
    };

    struct match_result {
        bool matched{false};
        // Normalized forms, as compared.
        std::string want{};
        std::string got{};
        // Captures first bound by this comparison; only meaningful when matched.
        std::map<std::string, std::string> bindings{};
    };

    std::string normalize_want(std::string_view want);
    std::string normalize_got(std::string_view got, option_flags flags);

    std::string strip_u_prefixes(std::string_view text);
    std::string strip_long_suffixes(std::string_view text);
    std::string normalize_path_separators(std::string_view text);
    std::string collapse_whitespace(std::string_view text);

    // Drops namespace qualification from the leading error kind of `line`:
    // "litmus::runs::resolve_error: x" -> "resolve_error: x".
    std::string strip_error_module(std::string_view line);

    match_result check_output(
            std::string_view want, std::string_view got, option_flags flags, const capture_table& captures = {});

}  // namespace litmus
