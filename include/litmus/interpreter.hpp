#pragma once

#include "guards.hpp"
#include "user_config.hpp"
#include "value.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace litmus::script {

    // Bindings shared by every example of one transcript file.
    class symbol_table {
      public:
        std::optional<value> lookup(std::string_view name) const;
        void assign(std::string name, value v);
        bool contains(std::string_view name) const;
        bool erase(std::string_view name);
        std::vector<std::string> names() const;
        std::size_t size() const { return bindings_.size(); }

      private:
        std::map<std::string, value, std::less<>> bindings_{};
    };

    // Process-facing state transcripts read through builtins.
    struct runtime_environment {
        std::vector<std::filesystem::path> search_path{};
        config_provider& user_config;
        std::optional<std::filesystem::path> samples_dir{};
        // Directories searched for model definitions; replaced for a scope by ModelPath.
        std::vector<std::filesystem::path> model_path{};
    };

    class execution_context {
      public:
        execution_context(symbol_table& names, runtime_environment& env, std::ostream& out, std::ostream& err);

        symbol_table& names() { return names_; }
        runtime_environment& env() { return env_; }
        resource_stack& resources() { return resources_; }

        std::ostream& out() { return *out_; }
        std::ostream& err() { return *err_; }
        void set_out(std::ostream& out) { out_ = &out; }
        void set_err(std::ostream& err) { err_ = &err; }
        std::ostream*& err_sink() { return err_; }

      private:
        symbol_table& names_;
        runtime_environment& env_;
        std::ostream* out_;
        std::ostream* err_;
        resource_stack resources_{};
    };

    namespace detail {
        struct statement;
    }  // namespace detail

    class program {
      public:
        program();
        program(program&&) noexcept;
        program& operator=(program&&) noexcept;
        ~program();

        std::size_t size() const { return statements_.size(); }

      private:
        friend program parse_program(std::string_view source, std::string_view origin);
        friend void execute(const program& prog, execution_context& ctx);

        std::vector<std::unique_ptr<detail::statement>> statements_{};
    };

    // Throws script_error (syntax_error) on malformed input.
    program parse_program(std::string_view source, std::string_view origin = "<input>"sv);

    // Runs each statement in order. Expression statements with a non-none value echo its
    // repr to the context output.
    void execute(const program& prog, execution_context& ctx);

    void evaluate(std::string_view source, execution_context& ctx, std::string_view origin = "<input>"sv);

    value evaluate_expression(std::string_view source, execution_context& ctx);

    // Calls a function or callable object value.
    value call(const value& callee, arguments& args, execution_context& ctx);

    // False while brackets, braces or a string literal are still open.
    bool input_is_complete(std::string_view source);

}  // namespace litmus::script
