#include "litmus/config.hpp"

#include <cstdlib>

namespace litmus {

    std::filesystem::path default_user_config_path() {
        if (auto* path = std::getenv(std::string{user_config_env}.c_str()); path != nullptr && *path != '\0') {
            return std::filesystem::path{path};
        }
        if (auto* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
            return std::filesystem::path{home} / ".litmus" / "config.json";
        }
        return std::filesystem::path{".litmus"} / "config.json";
    }

    void apply_environment(startup_config& cfg) {
        if (auto* value = std::getenv(std::string{report_first_failure_env}.c_str()); value != nullptr) {
            cfg.report_first_failure = std::string_view{value} == "1"sv;
        }
    }

}  // namespace litmus
