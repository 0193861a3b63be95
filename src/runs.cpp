#include "litmus/runs.hpp"

#include "internal/types.hpp"

extern "C" {
#include <stdlib.h>
}

#include <algorithm>
#include <chrono>
#include <format>
#include <random>
#include <system_error>

using namespace litmus::literals;

namespace litmus::runs {

    namespace fs = std::filesystem;

    namespace detail {

        static int64_t now_micros() {
            auto now = std::chrono::system_clock::now().time_since_epoch();
            return std::chrono::duration_cast<std::chrono::microseconds>(now).count();
        }

    }  // namespace detail

    run_record::run_record(fs::path dir, run_attrs attrs) : dir_{std::move(dir)}, attrs_{std::move(attrs)} {
        if (attrs_.id.empty()) {
            attrs_.id = dir_.filename().string();
        }
    }

    run_record run_record::from_dir(const fs::path& dir) {
        if (auto attrs = read_attrs(dir)) {
            return run_record{dir, std::move(*attrs)};
        }
        return run_record{dir, run_attrs{}};
    }

    fs::path meta_dir(const fs::path& run_dir) {
        return run_dir / meta_subdir;
    }

    std::optional<run_attrs> read_attrs(const fs::path& run_dir) {
        auto path = meta_dir(run_dir) / attrs_filename;
        std::error_code ec{};
        if (!fs::exists(path, ec) || ec) {
            return std::nullopt;
        }
        auto attrs = internal::read_json_file<run_attrs>(path);
        internal::validate_supported_schema_version(attrs.schema_version, path);
        return attrs;
    }

    void write_attrs(const fs::path& run_dir, const run_attrs& attrs) {
        auto dir = meta_dir(run_dir);
        std::error_code ec{};
        fs::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error("failed to create run metadata dir: {}"_format(dir.string()));
        }
        internal::write_json_file(attrs, dir / attrs_filename);
    }

    std::string read_output(const fs::path& run_dir) {
        auto path = meta_dir(run_dir) / output_filename;
        std::error_code ec{};
        if (!fs::exists(path, ec) || ec) {
            return {};
        }
        return internal::read_text_file(path);
    }

    std::string mkid() {
        static int64_t last_stamp = 0;
        static std::mt19937_64 rng{std::random_device{}()};

        auto stamp = detail::now_micros();
        if (stamp <= last_stamp) {
            stamp = last_stamp + 1;
        }
        last_stamp = stamp;
        return std::format("{:016x}{:016x}", static_cast<uint64_t>(stamp), rng());
    }

    fs::path init_home(const fs::path& home) {
        auto runs = home / runs_subdir;
        std::error_code ec{};
        fs::create_directories(runs, ec);
        if (ec) {
            throw std::runtime_error("failed to create runs root: {}"_format(runs.string()));
        }
        return home;
    }

    fs::path mkdtemp(std::string_view prefix) {
        auto pattern = (fs::temp_directory_path() / (std::string{prefix} + "XXXXXX")).string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("failed to create temporary directory from {}"_format(pattern));
        }
        return fs::path{pattern};
    }

    fs::path mktemp_home() {
        return init_home(mkdtemp("litmus-home-"sv));
    }

    run_store::run_store(fs::path home) : home_{std::move(home)} {}

    fs::path run_store::runs_dir() const {
        return home_ / runs_subdir;
    }

    fs::path run_store::run_dir(std::string_view id) const {
        return runs_dir() / std::string{id};
    }

    std::vector<run_record> run_store::runs() const {
        std::vector<run_record> out{};
        auto root = runs_dir();
        std::error_code ec{};
        if (!fs::is_directory(root, ec) || ec) {
            return out;
        }

        for (const auto& entry : fs::directory_iterator(root, ec)) {
            if (!entry.is_directory()) {
                continue;
            }
            out.push_back(run_record::from_dir(entry.path()));
        }
        if (ec) {
            throw std::runtime_error("failed to enumerate {}"_format(root.string()));
        }

        std::ranges::sort(out, [](const run_record& lhs, const run_record& rhs) {
            if (lhs.attrs().started != rhs.attrs().started) {
                return lhs.attrs().started > rhs.attrs().started;
            }
            return lhs.id() > rhs.id();
        });
        return out;
    }

    run_record run_store::lookup(std::string_view selector) const {
        if (selector.empty()) {
            throw resolve_error{"empty run selector"};
        }

        auto all = runs();

        const run_record* latest_for_op = nullptr;
        const run_record* marked_for_op = nullptr;
        for (const auto& run : all) {
            if (run.attrs().opspec != selector) {
                continue;
            }
            if (latest_for_op == nullptr) {
                latest_for_op = &run;
            }
            if (run.attrs().marked && marked_for_op == nullptr) {
                marked_for_op = &run;
            }
        }
        if (marked_for_op != nullptr) {
            return *marked_for_op;
        }
        if (latest_for_op != nullptr) {
            return *latest_for_op;
        }

        if (auto index = utils::parse_integer<std::size_t>(selector)) {
            if (*index >= 1U && *index <= all.size()) {
                return all[*index - 1U];
            }
        }

        std::vector<const run_record*> matches{};
        for (const auto& run : all) {
            if (run.id().starts_with(selector)) {
                matches.push_back(&run);
            }
        }
        if (matches.empty()) {
            throw resolve_error{"could not find run matching '{}'"_format(selector)};
        }
        if (matches.size() > 1U) {
            throw resolve_error{"'{}' matches {} runs"_format(selector, matches.size())};
        }
        return *matches.front();
    }

    std::vector<run_record> run_store::select(const std::vector<std::string>& selectors) const {
        if (selectors.empty()) {
            return runs();
        }
        std::vector<run_record> out{};
        for (const auto& selector : selectors) {
            auto run = lookup(selector);
            auto seen = std::ranges::any_of(out, [&](const run_record& r) { return r.id() == run.id(); });
            if (!seen) {
                out.push_back(std::move(run));
            }
        }
        return out;
    }

    fs::path resolve_run_dir(const run_store& store, run_request& request) {
        if (request.rerun && request.restart) {
            throw resolve_error{"rerun and restart cannot both be specified"};
        }
        if (request.run_dir) {
            return *request.run_dir;
        }
        if (request.rerun) {
            return store.lookup(*request.rerun).dir();
        }
        if (request.restart) {
            return store.lookup(*request.restart).dir();
        }

        auto dir = store.run_dir(mkid());
        request.run_dir = dir;
        return dir;
    }

}  // namespace litmus::runs
