#pragma once

#include "litmus/format.hpp"

extern "C" {
#include <fnmatch.h>
}

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace litmus::internal {

    using namespace litmus::literals;

    // Sorted paths under `root`, relative and with forward slashes. Regular files and
    // symlinks are listed; symlinked directories are listed but not descended into.
    inline std::vector<std::string> find_relative(const std::filesystem::path& root) {
        namespace fs = std::filesystem;

        std::vector<std::string> out{};
        std::error_code ec{};
        if (!fs::is_directory(root, ec)) {
            return out;
        }
        for (auto it = fs::recursive_directory_iterator(root, ec); it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            if (ec) {
                throw std::runtime_error("failed to walk {}: {}"_format(root.string(), ec.message()));
            }
            if (it->is_symlink(ec) || (!it->is_directory(ec) && !ec)) {
                out.push_back(it->path().lexically_relative(root).generic_string());
            }
        }
        if (ec) {
            throw std::runtime_error("failed to walk {}: {}"_format(root.string(), ec.message()));
        }
        std::ranges::sort(out);
        return out;
    }

    inline bool matches_any(std::string_view name, const std::vector<std::string>& patterns) {
        std::string subject{name};
        return std::ranges::any_of(
                patterns, [&](const std::string& p) { return ::fnmatch(p.c_str(), subject.c_str(), 0) == 0; });
    }

    // Sorted entry names of `dir`, skipping names matching any glob in `ignore`.
    inline std::vector<std::string> list_dir(const std::filesystem::path& dir, const std::vector<std::string>& ignore) {
        namespace fs = std::filesystem;

        std::vector<std::string> out{};
        std::error_code ec{};
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            auto name = entry.path().filename().string();
            if (!matches_any(name, ignore)) {
                out.push_back(std::move(name));
            }
        }
        if (ec) {
            throw std::runtime_error("failed to list {}: {}"_format(dir.string(), ec.message()));
        }
        std::ranges::sort(out);
        return out;
    }

    // Copies the regular files under `source` that are not hidden and not inside any of
    // `excluded`. Returns the copied paths relative to `source`.
    inline std::vector<std::filesystem::path> copy_visible_files(
            const std::filesystem::path& source,
            const std::filesystem::path& dest,
            const std::vector<std::filesystem::path>& excluded) {
        namespace fs = std::filesystem;

        auto is_hidden = [](const fs::path& relative) {
            return std::ranges::any_of(relative, [](const fs::path& part) {
                auto name = part.string();
                return name.size() > 1U && name.front() == '.' && name != "..";
            });
        };
        auto is_excluded = [&](const fs::path& path) {
            return std::ranges::any_of(excluded, [&](const fs::path& root) {
                auto rel = path.lexically_relative(root);
                return path == root || (!rel.empty() && *rel.begin() != "..");
            });
        };

        std::vector<fs::path> copied{};
        std::error_code ec{};
        for (auto it = fs::recursive_directory_iterator(source, ec); it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            if (ec) {
                throw std::runtime_error("failed to walk {}: {}"_format(source.string(), ec.message()));
            }
            auto relative = it->path().lexically_relative(source);
            if (is_hidden(relative) || is_excluded(it->path())) {
                if (it->is_directory()) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (!it->is_regular_file()) {
                continue;
            }

            auto target = dest / relative;
            fs::create_directories(target.parent_path(), ec);
            fs::copy_file(it->path(), target, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                throw std::runtime_error("failed to copy {}: {}"_format(relative.string(), ec.message()));
            }
            copied.push_back(std::move(relative));
        }
        if (ec) {
            throw std::runtime_error("failed to walk {}: {}"_format(source.string(), ec.message()));
        }
        return copied;
    }

}  // namespace litmus::internal
