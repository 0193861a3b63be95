#pragma once

#include "interpreter.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace litmus::script {

    inline constexpr auto script_extension = ".lit"sv;

    // Seeds `names` with every builtin function, replacing existing bindings of the same name.
    void install_builtins(symbol_table& names);

    // Sorted.
    std::vector<std::string> builtin_names();

}  // namespace litmus::script
