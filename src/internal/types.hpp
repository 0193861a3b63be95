#pragma once

#include "litmus/format.hpp"
#include "litmus/runs.hpp"

#include <glaze/glaze.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace litmus::internal {

    using namespace litmus::literals;

    struct published_run {
        std::string id{};
        std::string opspec{};
        std::string status{};
        std::optional<std::string> label{};
        std::map<std::string, std::string> flags{};
    };

    struct publish_summary {
        int schema_version{1};
        std::vector<published_run> runs{};
    };

    inline std::string read_text_file(const std::filesystem::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read {}"_format(path.string()));
        }
        return ss.str();
    }

    inline void write_text_file(const std::filesystem::path& path, std::string_view text) {
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        out << text;
        if (!out) {
            throw std::runtime_error("failed to write {}"_format(path.string()));
        }
    }

    template <typename T>
    void write_json_file(const T& value, const std::filesystem::path& path) {
        std::string json{};
        if (auto ec = glz::write<glz::opts{.prettify = true}>(value, json)) {
            throw std::runtime_error("failed to serialize json for {}"_format(path.string()));
        }
        json.push_back('\n');
        write_text_file(path, json);
    }

    template <typename T>
    T read_json_file(const std::filesystem::path& path) {
        T value{};
        auto json = read_text_file(path);
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json)) {
            throw std::runtime_error("failed to parse json file {}"_format(path.string()));
        }
        return value;
    }

    inline void validate_supported_schema_version(int schema_version, const std::filesystem::path& path) {
        constexpr int supported_schema_version = 1;
        if (schema_version > supported_schema_version) {
            throw std::runtime_error(
                    "unsupported schema_version in {}: {} > {}"_format(
                            path.string(), schema_version, supported_schema_version));
        }
    }

}  // namespace litmus::internal

namespace glz {

    template <>
    struct meta<litmus::runs::run_status> {
        using enum litmus::runs::run_status;
        static constexpr auto value =
                enumerate("pending", pending, "running", running, "completed", completed, "error", error);
    };

    template <>
    struct meta<litmus::runs::run_attrs> {
        using T = litmus::runs::run_attrs;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "id",
                       &T::id,
                       "opspec",
                       &T::opspec,
                       "flags",
                       &T::flags,
                       "cwd",
                       &T::cwd,
                       "started",
                       &T::started,
                       "stopped",
                       &T::stopped,
                       "exit_status",
                       &T::exit_status,
                       "status",
                       &T::status,
                       "label",
                       &T::label,
                       "marked",
                       &T::marked);
    };

    template <>
    struct meta<litmus::internal::published_run> {
        using T = litmus::internal::published_run;
        static constexpr auto value =
                object("id", &T::id, "opspec", &T::opspec, "status", &T::status, "label", &T::label, "flags", &T::flags);
    };

    template <>
    struct meta<litmus::internal::publish_summary> {
        using T = litmus::internal::publish_summary;
        static constexpr auto value = object("schema_version", &T::schema_version, "runs", &T::runs);
    };

}  // namespace glz
