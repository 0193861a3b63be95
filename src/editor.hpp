#pragma once

#include "litmus/config.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace litmus::cli {

    class line_editor {
      public:
        explicit line_editor(const startup_config& cfg);

        std::optional<std::string> read_line(std::string_view prompt);
        void record_history(std::string_view line);
    };

}  // namespace litmus::cli
