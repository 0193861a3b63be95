#pragma once

#include "config.hpp"
#include "error.hpp"
#include "matcher.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace litmus {

    inline constexpr auto transcript_extension = ".md"sv;

    // Head directives are only honored within this many leading bytes of a transcript.
    inline constexpr std::size_t head_directive_window = 256U;

    struct example {
        std::string source{};
        std::string want{};
        // 0-based line of the first prompt within the transcript
        std::size_t line{};
        std::size_t indent{};
        option_overrides options{};
    };

    struct head_directives {
        std::vector<platform_kind> skip_platforms{};
        option_overrides options{};

        bool skips(platform_kind platform) const;
    };

    struct transcript_file {
        std::string name{};
        std::filesystem::path path{};
        std::string text{};
        head_directives head{};
        std::vector<example> examples{};
    };

    head_directives parse_head_directives(std::string_view text);

    // Parses "+FLAG, -FLAG ..." (comma or blank separated). Unknown names throw.
    option_overrides parse_option_list(std::string_view text, std::string_view origin, std::size_t line);

    std::vector<example> parse_examples(std::string_view text, std::string_view origin = "<string>"sv);

    // Bare names (without extension) of every transcript under `root`, sorted.
    std::vector<std::string> all_tests(const std::filesystem::path& root);

    std::filesystem::path transcript_path(const std::filesystem::path& root, std::string_view name);

    // Reads and parses `<root>/<name>.md`; throws transcript_not_found when absent.
    transcript_file load_transcript(const std::filesystem::path& root, std::string_view name);

    std::vector<transcript_file> discover(const std::filesystem::path& root);

}  // namespace litmus
