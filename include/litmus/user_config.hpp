#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace litmus {

    using user_config_map = std::map<std::string, std::string>;

    // Source of user configuration seen by transcripts. Reads a JSON object of string values
    // from `path` on first use and caches it; an installed override shadows the file until
    // cleared, and clearing also drops the cache so the next read comes from disk.
    class config_provider {
      public:
        explicit config_provider(std::filesystem::path path);

        const user_config_map& read();

        void set_override(user_config_map payload);
        void clear_override();
        bool has_override() const { return override_.has_value(); }
        const std::optional<user_config_map>& current_override() const { return override_; }

        const std::filesystem::path& path() const { return path_; }

      private:
        std::filesystem::path path_{};
        std::optional<user_config_map> override_{};
        std::optional<user_config_map> cached_{};
    };

}  // namespace litmus
