#include "litmus/user_config.hpp"

#include "litmus/format.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace litmus::literals;

namespace litmus {

    namespace fs = std::filesystem;

    config_provider::config_provider(fs::path path) : path_{std::move(path)} {}

    const user_config_map& config_provider::read() {
        if (override_) {
            return *override_;
        }
        if (cached_) {
            return *cached_;
        }

        user_config_map data{};
        std::error_code ec{};
        if (fs::exists(path_, ec) && !ec) {
            std::ifstream in{path_};
            if (!in) {
                throw std::runtime_error("failed to open user config {}"_format(path_.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            auto json = ss.str();
            if (!utils::trim_view(json).empty()) {
                if (auto err = glz::read_json(data, json)) {
                    throw std::runtime_error("failed to parse user config {}"_format(path_.string()));
                }
            }
        }
        cached_ = std::move(data);
        return *cached_;
    }

    void config_provider::set_override(user_config_map payload) {
        override_ = std::move(payload);
    }

    void config_provider::clear_override() {
        override_.reset();
        cached_.reset();
    }

}  // namespace litmus
