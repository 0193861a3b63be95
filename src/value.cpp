#include "litmus/value.hpp"

#include "litmus/format.hpp"
#include "litmus/utils.hpp"

using namespace litmus::literals;

namespace litmus::script {

    namespace detail {

        template <typename... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };

        static std::string quote(std::string_view text) {
            std::string out{"\""};
            for (auto c : text) {
                switch (c) {
                    case '\\':
                        out += "\\\\";
                        break;
                    case '"':
                        out += "\\\"";
                        break;
                    case '\n':
                        out += "\\n";
                        break;
                    case '\t':
                        out += "\\t";
                        break;
                    default:
                        out.push_back(c);
                }
            }
            out.push_back('"');
            return out;
        }

        [[noreturn]] static void type_mismatch(const value& v, std::string_view expected) {
            throw script_error{errors::type_error, "expected {}, got {}"_format(expected, v.type_name())};
        }

    }  // namespace detail

    value value::list(std::vector<value> items) {
        value v{};
        v.data_ = std::make_shared<list_value>(list_value{std::move(items)});
        return v;
    }

    value value::map(std::map<std::string, value> items) {
        value v{};
        v.data_ = std::make_shared<map_value>(map_value{std::move(items)});
        return v;
    }

    value value::function(std::string name, native_function fn) {
        value v{};
        v.data_ = std::make_shared<const function_value>(function_value{std::move(name), std::move(fn)});
        return v;
    }

    bool value::as_bool() const {
        if (auto* b = std::get_if<bool>(&data_)) {
            return *b;
        }
        detail::type_mismatch(*this, "bool"sv);
    }

    int64_t value::as_int() const {
        if (auto* i = std::get_if<int64_t>(&data_)) {
            return *i;
        }
        detail::type_mismatch(*this, "int"sv);
    }

    const std::string& value::as_string() const {
        if (auto* s = std::get_if<std::string>(&data_)) {
            return *s;
        }
        detail::type_mismatch(*this, "string"sv);
    }

    std::vector<value>& value::as_list() const {
        if (auto* l = std::get_if<std::shared_ptr<list_value>>(&data_)) {
            return (*l)->items;
        }
        detail::type_mismatch(*this, "list"sv);
    }

    std::map<std::string, value>& value::as_map() const {
        if (auto* m = std::get_if<std::shared_ptr<map_value>>(&data_)) {
            return (*m)->items;
        }
        detail::type_mismatch(*this, "map"sv);
    }

    const function_value& value::as_function() const {
        if (auto* f = std::get_if<std::shared_ptr<const function_value>>(&data_)) {
            return **f;
        }
        detail::type_mismatch(*this, "function"sv);
    }

    const std::shared_ptr<object>& value::as_object() const {
        if (auto* o = std::get_if<std::shared_ptr<object>>(&data_)) {
            return *o;
        }
        detail::type_mismatch(*this, "object"sv);
    }

    std::string_view value::type_name() const {
        return std::visit(
                detail::overloaded{
                        [](const none_t&) { return "none"sv; },
                        [](bool) { return "bool"sv; },
                        [](int64_t) { return "int"sv; },
                        [](const std::string&) { return "string"sv; },
                        [](const std::shared_ptr<list_value>&) { return "list"sv; },
                        [](const std::shared_ptr<map_value>&) { return "map"sv; },
                        [](const std::shared_ptr<const function_value>&) { return "function"sv; },
                        [](const std::shared_ptr<object>& obj) { return obj->type_name(); }},
                data_);
    }

    bool value::truthy() const {
        return std::visit(
                detail::overloaded{
                        [](const none_t&) { return false; },
                        [](bool b) { return b; },
                        [](int64_t i) { return i != 0; },
                        [](const std::string& s) { return !s.empty(); },
                        [](const std::shared_ptr<list_value>& l) { return !l->items.empty(); },
                        [](const std::shared_ptr<map_value>& m) { return !m->items.empty(); },
                        [](const std::shared_ptr<const function_value>&) { return true; },
                        [](const std::shared_ptr<object>&) { return true; }},
                data_);
    }

    bool operator==(const value& lhs, const value& rhs) {
        if (lhs.data().index() != rhs.data().index()) {
            return false;
        }
        if (lhs.is_list()) {
            return lhs.as_list() == rhs.as_list();
        }
        if (lhs.is_map()) {
            return lhs.as_map() == rhs.as_map();
        }
        return lhs.data() == rhs.data();
    }

    std::string repr(const value& v) {
        return std::visit(
                detail::overloaded{
                        [](const none_t&) -> std::string { return "none"; },
                        [](bool b) -> std::string { return b ? "true" : "false"; },
                        [](int64_t i) -> std::string { return std::to_string(i); },
                        [](const std::string& s) -> std::string { return detail::quote(s); },
                        [](const std::shared_ptr<list_value>& l) -> std::string {
                            std::vector<std::string> parts{};
                            for (const auto& item : l->items) {
                                parts.push_back(repr(item));
                            }
                            return "[" + utils::join_with_separator(parts, ", "sv) + "]";
                        },
                        [](const std::shared_ptr<map_value>& m) -> std::string {
                            std::vector<std::string> parts{};
                            for (const auto& [key, item] : m->items) {
                                parts.push_back(detail::quote(key) + ": " + repr(item));
                            }
                            return "{" + utils::join_with_separator(parts, ", "sv) + "}";
                        },
                        [](const std::shared_ptr<const function_value>& f) -> std::string {
                            return "<builtin {}>"_format(f->name);
                        },
                        [](const std::shared_ptr<object>& obj) -> std::string { return obj->repr(); }},
                v.data());
    }

    std::string str(const value& v) {
        if (v.is_string()) {
            return v.as_string();
        }
        return repr(v);
    }

    std::optional<value> arguments::keyword(std::string_view name) const {
        for (const auto& [key, v] : keywords) {
            if (key == name) {
                return v;
            }
        }
        return std::nullopt;
    }

    std::optional<value> arguments::get(std::size_t index, std::string_view name) const {
        if (index < positional.size()) {
            return positional[index];
        }
        return keyword(name);
    }

    value arguments::require(std::size_t index, std::string_view name, std::string_view fn) const {
        if (auto v = get(index, name)) {
            return *v;
        }
        throw script_error{errors::type_error, "{}() missing required argument '{}'"_format(fn, name)};
    }

    void arguments::expect_at_most(std::size_t count, std::string_view fn) const {
        if (positional.size() > count) {
            throw script_error{
                    errors::type_error,
                    "{}() takes at most {} positional arguments ({} given)"_format(fn, count, positional.size())};
        }
    }

    std::optional<value> object::get_attr(std::string_view) {
        return std::nullopt;
    }

    bool object::set_attr(std::string_view, value) {
        return false;
    }

    std::optional<value> object::call_method(std::string_view, arguments&, execution_context&) {
        return std::nullopt;
    }

    std::string object::repr() const {
        return "<{}>"_format(type_name());
    }

}  // namespace litmus::script
