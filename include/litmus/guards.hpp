#pragma once

#include "user_config.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace litmus {

    // A temporary change to one piece of process-wide state. `enter` records the prior value
    // and installs the new one; `exit` restores the prior value exactly once and never throws.
    class scoped_state {
      public:
        scoped_state() = default;
        scoped_state(const scoped_state&) = delete;
        scoped_state& operator=(const scoped_state&) = delete;
        virtual ~scoped_state() = default;

        void enter();
        void exit() noexcept;
        bool entered() const { return entered_; }

        virtual std::string_view name() const = 0;

      protected:
        virtual void on_enter() = 0;
        virtual void on_exit() noexcept = 0;

      private:
        bool entered_{false};
    };

    class scoped_cwd final : public scoped_state {
      public:
        explicit scoped_cwd(std::filesystem::path target);
        ~scoped_cwd() override { exit(); }

        std::string_view name() const override { return "Chdir"; }

      protected:
        void on_enter() override;
        void on_exit() noexcept override;

      private:
        std::filesystem::path target_{};
        std::filesystem::path previous_{};
    };

    // Values of std::nullopt unset the variable for the scope.
    using env_overlay = std::map<std::string, std::optional<std::string>>;

    class scoped_env final : public scoped_state {
      public:
        explicit scoped_env(env_overlay values);
        ~scoped_env() override { exit(); }

        std::string_view name() const override { return "Env"; }

      protected:
        void on_enter() override;
        void on_exit() noexcept override;

      private:
        env_overlay values_{};
        // prior presence/value per name, in application order
        std::vector<std::pair<std::string, std::optional<std::string>>> previous_{};
    };

    class scoped_search_path final : public scoped_state {
      public:
        using path_list = std::vector<std::filesystem::path>;

        // `replacement` defaults to the list current at enter time.
        scoped_search_path(
                path_list& target,
                std::optional<path_list> replacement,
                path_list prepend = {},
                path_list append = {});
        ~scoped_search_path() override { exit(); }

        std::string_view name() const override { return "SysPath"; }

      protected:
        void on_enter() override;
        void on_exit() noexcept override;

      private:
        path_list& target_;
        std::optional<path_list> replacement_{};
        path_list prepend_{};
        path_list append_{};
        path_list previous_{};
    };

    // Installs a model search list for the scope.
    class scoped_model_path final : public scoped_state {
      public:
        using path_list = std::vector<std::filesystem::path>;

        scoped_model_path(path_list& target, path_list replacement);
        ~scoped_model_path() override { exit(); }

        std::string_view name() const override { return "ModelPath"; }

      protected:
        void on_enter() override;
        void on_exit() noexcept override;

      private:
        path_list& target_;
        path_list replacement_{};
        path_list previous_{};
    };

    // Creates an empty temporary file for the scope and removes it on exit unless kept.
    class scoped_temp_file final : public scoped_state {
      public:
        explicit scoped_temp_file(std::string prefix = "litmus-", std::string suffix = "", bool keep = false);
        ~scoped_temp_file() override { exit(); }

        std::string_view name() const override { return "TempFile"; }

        // Empty until entered.
        const std::filesystem::path& path() const { return path_; }

      protected:
        void on_enter() override;
        void on_exit() noexcept override;

      private:
        std::string prefix_{};
        std::string suffix_{};
        bool keep_{false};
        std::filesystem::path path_{};
    };

    class scoped_config final : public scoped_state {
      public:
        scoped_config(config_provider& provider, user_config_map payload);
        ~scoped_config() override { exit(); }

        std::string_view name() const override { return "UserConfig"; }

      protected:
        void on_enter() override;
        void on_exit() noexcept override;

      private:
        config_provider& provider_;
        user_config_map payload_{};
        // override active before enter; restored in place of clearing when present
        std::optional<user_config_map> previous_{};
    };

    // Redirects a diagnostic sink into an internal buffer for the scope.
    class scoped_stderr_capture final : public scoped_state {
      public:
        explicit scoped_stderr_capture(std::ostream*& sink);
        ~scoped_stderr_capture() override { exit(); }

        std::string_view name() const override { return "StderrCapture"; }

        std::string captured() const { return buffer_.str(); }
        void print(std::ostream& out) const;

      protected:
        void on_enter() override;
        void on_exit() noexcept override;

      private:
        std::ostream*& sink_;
        std::ostream* previous_{nullptr};
        std::ostringstream buffer_{};
    };

    // Entered guards in acquisition order; unwinding restores strictly last-in first-out.
    class resource_stack {
      public:
        resource_stack() = default;
        resource_stack(const resource_stack&) = delete;
        resource_stack& operator=(const resource_stack&) = delete;
        ~resource_stack() { unwind_to(0U); }

        // Enters `guard`; it is only retained when enter succeeds.
        void push(std::shared_ptr<scoped_state> guard);
        void unwind_to(std::size_t depth) noexcept;

        std::size_t depth() const { return entered_.size(); }

      private:
        std::vector<std::shared_ptr<scoped_state>> entered_{};
    };

}  // namespace litmus
