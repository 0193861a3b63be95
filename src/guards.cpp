#include "litmus/guards.hpp"

#include "litmus/format.hpp"
#include "litmus/utils.hpp"

extern "C" {
#include <stdlib.h>
#include <unistd.h>
}

#include <cerrno>
#include <stdexcept>
#include <system_error>

using namespace litmus::literals;

namespace litmus {

    namespace fs = std::filesystem;

    namespace detail {

        static std::optional<std::string> read_env(const std::string& key) {
            if (auto* value = std::getenv(key.c_str()); value != nullptr) {
                return std::string{value};
            }
            return std::nullopt;
        }

        static void write_env(const std::string& key, const std::optional<std::string>& value) noexcept {
            int rc = value ? ::setenv(key.c_str(), value->c_str(), 1) : ::unsetenv(key.c_str());
            if (rc != 0) {
                debug_log("failed to restore environment variable ", key);
            }
        }

    }  // namespace detail

    void scoped_state::enter() {
        if (entered_) {
            throw std::runtime_error("{} guard is already entered"_format(name()));
        }
        on_enter();
        entered_ = true;
    }

    void scoped_state::exit() noexcept {
        if (!entered_) {
            return;
        }
        entered_ = false;
        on_exit();
    }

    scoped_cwd::scoped_cwd(fs::path target) : target_{std::move(target)} {}

    void scoped_cwd::on_enter() {
        previous_ = fs::current_path();
        std::error_code ec{};
        fs::current_path(target_, ec);
        if (ec) {
            throw std::runtime_error("failed to change directory to {}: {}"_format(target_.string(), ec.message()));
        }
    }

    void scoped_cwd::on_exit() noexcept {
        std::error_code ec{};
        fs::current_path(previous_, ec);
        if (ec) {
            debug_log("failed to restore working directory ", previous_.string());
        }
    }

    scoped_env::scoped_env(env_overlay values) : values_{std::move(values)} {}

    void scoped_env::on_enter() {
        previous_.clear();
        for (const auto& [key, value] : values_) {
            previous_.emplace_back(key, detail::read_env(key));
            int rc = value ? ::setenv(key.c_str(), value->c_str(), 1) : ::unsetenv(key.c_str());
            if (rc != 0) {
                on_exit();
                throw std::runtime_error("failed to set environment variable {}"_format(key));
            }
        }
    }

    void scoped_env::on_exit() noexcept {
        for (auto it = previous_.rbegin(); it != previous_.rend(); ++it) {
            detail::write_env(it->first, it->second);
        }
        previous_.clear();
    }

    scoped_search_path::scoped_search_path(
            path_list& target, std::optional<path_list> replacement, path_list prepend, path_list append)
            : target_{target},
              replacement_{std::move(replacement)},
              prepend_{std::move(prepend)},
              append_{std::move(append)} {}

    void scoped_search_path::on_enter() {
        previous_ = target_;
        path_list next = prepend_;
        const auto& base = replacement_ ? *replacement_ : previous_;
        next.insert(next.end(), base.begin(), base.end());
        next.insert(next.end(), append_.begin(), append_.end());
        target_ = std::move(next);
    }

    void scoped_search_path::on_exit() noexcept {
        target_.swap(previous_);
        previous_.clear();
    }

    scoped_model_path::scoped_model_path(path_list& target, path_list replacement)
            : target_{target}, replacement_{std::move(replacement)} {}

    void scoped_model_path::on_enter() {
        previous_ = target_;
        target_ = replacement_;
    }

    void scoped_model_path::on_exit() noexcept {
        target_.swap(previous_);
        previous_.clear();
    }

    scoped_temp_file::scoped_temp_file(std::string prefix, std::string suffix, bool keep)
            : prefix_{std::move(prefix)}, suffix_{std::move(suffix)}, keep_{keep} {}

    void scoped_temp_file::on_enter() {
        auto pattern = (fs::temp_directory_path() / (prefix_ + "XXXXXX" + suffix_)).string();
        std::vector<char> buffer{pattern.begin(), pattern.end()};
        buffer.push_back('\0');

        int fd = ::mkstemps(buffer.data(), static_cast<int>(suffix_.size()));
        if (fd == -1) {
            throw std::system_error{errno, std::generic_category(), "failed to create temporary file"};
        }
        ::close(fd);
        path_ = fs::path{buffer.data()};
    }

    void scoped_temp_file::on_exit() noexcept {
        if (!keep_) {
            std::error_code ec{};
            fs::remove(path_, ec);
            if (ec) {
                debug_log("failed to remove temporary file ", path_.string());
            }
        }
    }

    scoped_config::scoped_config(config_provider& provider, user_config_map payload)
            : provider_{provider}, payload_{std::move(payload)} {}

    void scoped_config::on_enter() {
        previous_ = provider_.current_override();
        provider_.set_override(payload_);
    }

    void scoped_config::on_exit() noexcept {
        if (previous_) {
            provider_.set_override(std::move(*previous_));
            previous_.reset();
            return;
        }
        provider_.clear_override();
    }

    scoped_stderr_capture::scoped_stderr_capture(std::ostream*& sink) : sink_{sink} {}

    void scoped_stderr_capture::on_enter() {
        buffer_.str({});
        buffer_.clear();
        previous_ = sink_;
        sink_ = &buffer_;
    }

    void scoped_stderr_capture::on_exit() noexcept {
        sink_ = previous_;
        previous_ = nullptr;
    }

    void scoped_stderr_capture::print(std::ostream& out) const {
        out << buffer_.str();
        out.flush();
    }

    void resource_stack::push(std::shared_ptr<scoped_state> guard) {
        if (!guard) {
            throw std::invalid_argument("resource_stack::push requires a guard");
        }
        guard->enter();
        entered_.push_back(std::move(guard));
    }

    void resource_stack::unwind_to(std::size_t depth) noexcept {
        while (entered_.size() > depth) {
            entered_.back()->exit();
            entered_.pop_back();
        }
    }

}  // namespace litmus
