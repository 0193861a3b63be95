#pragma once

#include "error.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace litmus {
    class scoped_state;
}  // namespace litmus

namespace litmus::script {

    using namespace std::string_view_literals;

    namespace errors {
        inline constexpr auto syntax_error = "litmus::script::syntax_error"sv;
        inline constexpr auto name_error = "litmus::script::name_error"sv;
        inline constexpr auto type_error = "litmus::script::type_error"sv;
        inline constexpr auto value_error = "litmus::script::value_error"sv;
        inline constexpr auto index_error = "litmus::script::index_error"sv;
        inline constexpr auto key_error = "litmus::script::key_error"sv;
        inline constexpr auto attribute_error = "litmus::script::attribute_error"sv;
        inline constexpr auto zero_division_error = "litmus::script::zero_division_error"sv;
        inline constexpr auto overflow_error = "litmus::script::overflow_error"sv;
        inline constexpr auto os_error = "litmus::script::os_error"sv;
    }  // namespace errors

    class script_error : public error {
      public:
        script_error(std::string_view kind, std::string message) : error{std::string{kind}, std::move(message)} {}
    };

    class value;
    class object;
    class execution_context;
    struct arguments;
    struct list_value;
    struct map_value;

    using native_function = std::function<value(arguments&, execution_context&)>;

    struct function_value {
        std::string name{};
        native_function fn{};
    };

    struct none_t {
        bool operator==(const none_t&) const = default;
    };

    inline constexpr none_t none{};

    class value {
      public:
        using storage = std::variant<
                none_t,
                bool,
                int64_t,
                std::string,
                std::shared_ptr<list_value>,
                std::shared_ptr<map_value>,
                std::shared_ptr<const function_value>,
                std::shared_ptr<object>>;

        value() = default;
        value(none_t) {}
        value(bool b) : data_{b} {}
        value(int i) : data_{static_cast<int64_t>(i)} {}
        value(int64_t i) : data_{i} {}
        value(std::size_t i) : data_{static_cast<int64_t>(i)} {}
        value(std::string s) : data_{std::move(s)} {}
        value(std::string_view s) : data_{std::string{s}} {}
        value(const char* s) : data_{std::string{s}} {}
        value(std::shared_ptr<object> obj) : data_{std::move(obj)} {}

        static value list(std::vector<value> items = {});
        static value map(std::map<std::string, value> items = {});
        static value function(std::string name, native_function fn);

        bool is_none() const { return std::holds_alternative<none_t>(data_); }
        bool is_bool() const { return std::holds_alternative<bool>(data_); }
        bool is_int() const { return std::holds_alternative<int64_t>(data_); }
        bool is_string() const { return std::holds_alternative<std::string>(data_); }
        bool is_list() const { return std::holds_alternative<std::shared_ptr<list_value>>(data_); }
        bool is_map() const { return std::holds_alternative<std::shared_ptr<map_value>>(data_); }
        bool is_function() const { return std::holds_alternative<std::shared_ptr<const function_value>>(data_); }
        bool is_object() const { return std::holds_alternative<std::shared_ptr<object>>(data_); }

        // Typed accessors throw type_error on mismatch.
        bool as_bool() const;
        int64_t as_int() const;
        const std::string& as_string() const;
        std::vector<value>& as_list() const;
        std::map<std::string, value>& as_map() const;
        const function_value& as_function() const;
        const std::shared_ptr<object>& as_object() const;

        template <typename T>
        std::shared_ptr<T> object_as() const {
            if (auto* obj = std::get_if<std::shared_ptr<object>>(&data_)) {
                return std::dynamic_pointer_cast<T>(*obj);
            }
            return nullptr;
        }

        std::string_view type_name() const;
        bool truthy() const;

        const storage& data() const { return data_; }

      private:
        storage data_{};
    };

    struct list_value {
        std::vector<value> items{};
    };

    struct map_value {
        std::map<std::string, value> items{};
    };

    bool operator==(const value& lhs, const value& rhs);

    // Source-like rendering: strings quoted, containers recursive.
    std::string repr(const value& v);
    // Strings unquoted, everything else as repr.
    std::string str(const value& v);

    struct arguments {
        std::vector<value> positional{};
        std::vector<std::pair<std::string, value>> keywords{};

        std::optional<value> keyword(std::string_view name) const;
        // Positional `index`, else keyword `name`.
        std::optional<value> get(std::size_t index, std::string_view name) const;
        value require(std::size_t index, std::string_view name, std::string_view fn) const;
        void expect_at_most(std::size_t count, std::string_view fn) const;
    };

    // Host object reachable from transcript code.
    class object {
      public:
        virtual ~object() = default;

        virtual std::string_view type_name() const = 0;
        virtual std::optional<value> get_attr(std::string_view name);
        // False when the object does not accept the attribute.
        virtual bool set_attr(std::string_view name, value v);
        virtual std::optional<value> call_method(std::string_view name, arguments& args, execution_context& ctx);
        virtual std::string repr() const;

        // Guard entered for the body of a `with` block; nullptr when not a guard.
        virtual std::shared_ptr<scoped_state> guard() { return nullptr; }
    };

}  // namespace litmus::script
