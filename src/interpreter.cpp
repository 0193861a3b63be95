#include "litmus/interpreter.hpp"

#include "litmus/format.hpp"
#include "litmus/utils.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

using namespace litmus::literals;

namespace litmus::script {

    namespace detail {

        enum class token_kind : uint8_t { identifier, integer, string, keyword, op, newline, end };

        struct token {
            token_kind kind{token_kind::end};
            std::string text{};
            int64_t number{};
            std::size_t line{};
        };

        static constexpr std::string_view keywords[] = {
                "true"sv, "false"sv, "none"sv, "and"sv, "or"sv, "not"sv, "in"sv, "with"sv, "as"sv};

        static constexpr std::string_view two_char_ops[] = {"=="sv, "!="sv, "<="sv, ">="sv};
        static constexpr auto single_char_ops = "()[]{},:.;=<>+-*/%"sv;

        [[noreturn]] static void syntax_error(std::string_view origin, std::size_t line, std::string_view message) {
            throw script_error{errors::syntax_error, "{}:{}: {}"_format(origin, line + 1U, message)};
        }

        class lexer {
          public:
            lexer(std::string_view source, std::string_view origin) : source_{source}, origin_{origin} {}

            std::vector<token> tokenize() {
                std::vector<token> out{};
                while (pos_ < source_.size()) {
                    auto c = source_[pos_];
                    if (c == '\n') {
                        out.push_back(token{token_kind::newline, "\n", 0, line_});
                        ++line_;
                        ++pos_;
                        continue;
                    }
                    if (utils::is_blank(c)) {
                        ++pos_;
                        continue;
                    }
                    if (c == '#') {
                        while (pos_ < source_.size() && source_[pos_] != '\n') {
                            ++pos_;
                        }
                        continue;
                    }
                    if (c >= '0' && c <= '9') {
                        out.push_back(read_number());
                        continue;
                    }
                    if (utils::is_identifier_start(c)) {
                        out.push_back(read_word());
                        continue;
                    }
                    if (c == '"' || c == '\'') {
                        out.push_back(read_string(c));
                        continue;
                    }
                    out.push_back(read_op());
                }
                out.push_back(token{token_kind::end, {}, 0, line_});
                return out;
            }

          private:
            token read_number() {
                auto start = pos_;
                while (pos_ < source_.size() && source_[pos_] >= '0' && source_[pos_] <= '9') {
                    ++pos_;
                }
                auto text = source_.substr(start, pos_ - start);
                auto parsed = utils::parse_integer<int64_t>(text);
                if (!parsed) {
                    syntax_error(origin_, line_, "integer literal out of range: {}"_format(text));
                }
                return token{token_kind::integer, std::string{text}, *parsed, line_};
            }

            token read_word() {
                auto start = pos_;
                while (pos_ < source_.size() && utils::is_identifier_char(source_[pos_])) {
                    ++pos_;
                }
                auto text = source_.substr(start, pos_ - start);
                auto is_keyword = std::ranges::find(keywords, text) != std::end(keywords);
                return token{is_keyword ? token_kind::keyword : token_kind::identifier, std::string{text}, 0, line_};
            }

            token read_string(char quote) {
                auto start_line = line_;
                ++pos_;
                std::string text{};
                while (true) {
                    if (pos_ >= source_.size() || source_[pos_] == '\n') {
                        syntax_error(origin_, start_line, "unterminated string literal");
                    }
                    auto c = source_[pos_++];
                    if (c == quote) {
                        break;
                    }
                    if (c != '\\') {
                        text.push_back(c);
                        continue;
                    }
                    if (pos_ >= source_.size()) {
                        syntax_error(origin_, start_line, "unterminated string literal");
                    }
                    auto escaped = source_[pos_++];
                    switch (escaped) {
                        case 'n':
                            text.push_back('\n');
                            break;
                        case 't':
                            text.push_back('\t');
                            break;
                        case '\\':
                        case '"':
                        case '\'':
                            text.push_back(escaped);
                            break;
                        default:
                            text.push_back('\\');
                            text.push_back(escaped);
                    }
                }
                return token{token_kind::string, std::move(text), 0, start_line};
            }

            token read_op() {
                auto rest = source_.substr(pos_);
                for (auto op : two_char_ops) {
                    if (rest.starts_with(op)) {
                        pos_ += op.size();
                        return token{token_kind::op, std::string{op}, 0, line_};
                    }
                }
                if (single_char_ops.find(rest.front()) == std::string_view::npos) {
                    syntax_error(origin_, line_, "unexpected character '{}'"_format(rest.front()));
                }
                ++pos_;
                return token{token_kind::op, std::string(1U, rest.front()), 0, line_};
            }

            std::string_view source_;
            std::string_view origin_;
            std::size_t pos_{0U};
            std::size_t line_{0U};
        };

        // -- expressions -------------------------------------------------------------------

        struct expression {
            virtual ~expression() = default;
            virtual value eval(execution_context& ctx) const = 0;
        };

        using expression_ptr = std::unique_ptr<expression>;

        struct literal_expr final : expression {
            value constant{};

            explicit literal_expr(value v) : constant{std::move(v)} {}
            value eval(execution_context&) const override { return constant; }
        };

        struct name_expr final : expression {
            std::string name{};

            explicit name_expr(std::string n) : name{std::move(n)} {}

            value eval(execution_context& ctx) const override {
                if (auto v = ctx.names().lookup(name)) {
                    return *v;
                }
                throw script_error{errors::name_error, "name '{}' is not defined"_format(name)};
            }
        };

        struct list_expr final : expression {
            std::vector<expression_ptr> items{};

            value eval(execution_context& ctx) const override {
                std::vector<value> out{};
                out.reserve(items.size());
                for (const auto& item : items) {
                    out.push_back(item->eval(ctx));
                }
                return value::list(std::move(out));
            }
        };

        struct map_expr final : expression {
            std::vector<std::pair<expression_ptr, expression_ptr>> entries{};

            value eval(execution_context& ctx) const override {
                std::map<std::string, value> out{};
                for (const auto& [key, item] : entries) {
                    auto k = key->eval(ctx);
                    if (!k.is_string()) {
                        throw script_error{errors::type_error, "map keys must be strings, got {}"_format(k.type_name())};
                    }
                    out.insert_or_assign(k.as_string(), item->eval(ctx));
                }
                return value::map(std::move(out));
            }
        };

        static int64_t checked_int(const value& v, std::string_view op) {
            if (!v.is_int()) {
                throw script_error{errors::type_error, "unsupported operand type for {}: {}"_format(op, v.type_name())};
            }
            return v.as_int();
        }

        [[noreturn]] static void integer_overflow(int64_t a, std::string_view op, int64_t b) {
            throw script_error{errors::overflow_error, "integer overflow in {} {} {}"_format(a, op, b)};
        }

        // Integer arithmetic over the full int64 range; results outside it raise overflow_error.
        static int64_t arithmetic(std::string_view op, int64_t a, int64_t b) {
            int64_t out{};
            if (op == "+") {
                if (__builtin_add_overflow(a, b, &out)) {
                    integer_overflow(a, op, b);
                }
                return out;
            }
            if (op == "-") {
                if (__builtin_sub_overflow(a, b, &out)) {
                    integer_overflow(a, op, b);
                }
                return out;
            }
            if (op == "*") {
                if (__builtin_mul_overflow(a, b, &out)) {
                    integer_overflow(a, op, b);
                }
                return out;
            }
            if (b == 0) {
                throw script_error{errors::zero_division_error, "division by zero"};
            }
            if (a == std::numeric_limits<int64_t>::min() && b == -1) {
                if (op == "%") {
                    return 0;
                }
                integer_overflow(a, op, b);
            }
            return op == "/" ? a / b : a % b;
        }

        static value repeat(const value& seq, int64_t count) {
            count = std::max<int64_t>(count, 0);
            if (seq.is_string()) {
                std::string out{};
                for (int64_t i = 0; i < count; ++i) {
                    out += seq.as_string();
                }
                return out;
            }
            std::vector<value> out{};
            for (int64_t i = 0; i < count; ++i) {
                out.insert(out.end(), seq.as_list().begin(), seq.as_list().end());
            }
            return value::list(std::move(out));
        }

        static bool contains(const value& container, const value& item) {
            if (container.is_string()) {
                if (!item.is_string()) {
                    throw script_error{errors::type_error, "'in <string>' requires a string operand"};
                }
                return container.as_string().find(item.as_string()) != std::string::npos;
            }
            if (container.is_list()) {
                return std::ranges::find(container.as_list(), item) != container.as_list().end();
            }
            if (container.is_map()) {
                return item.is_string() && container.as_map().contains(item.as_string());
            }
            throw script_error{errors::type_error, "argument of type {} is not a container"_format(container.type_name())};
        }

        static bool less_than(const value& lhs, const value& rhs, std::string_view op) {
            if (lhs.is_int() && rhs.is_int()) {
                return lhs.as_int() < rhs.as_int();
            }
            if (lhs.is_string() && rhs.is_string()) {
                return lhs.as_string() < rhs.as_string();
            }
            throw script_error{
                    errors::type_error,
                    "'{}' not supported between {} and {}"_format(op, lhs.type_name(), rhs.type_name())};
        }

        struct unary_expr final : expression {
            std::string op{};
            expression_ptr operand{};

            value eval(execution_context& ctx) const override {
                auto v = operand->eval(ctx);
                if (op == "not") {
                    return !v.truthy();
                }
                return arithmetic("-"sv, 0, checked_int(v, op));
            }
        };

        struct binary_expr final : expression {
            std::string op{};
            expression_ptr lhs{};
            expression_ptr rhs{};

            value eval(execution_context& ctx) const override {
                if (op == "and") {
                    auto l = lhs->eval(ctx);
                    return l.truthy() ? rhs->eval(ctx) : l;
                }
                if (op == "or") {
                    auto l = lhs->eval(ctx);
                    return l.truthy() ? l : rhs->eval(ctx);
                }

                auto l = lhs->eval(ctx);
                auto r = rhs->eval(ctx);

                if (op == "==") {
                    return l == r;
                }
                if (op == "!=") {
                    return !(l == r);
                }
                if (op == "<") {
                    return less_than(l, r, op);
                }
                if (op == ">") {
                    return less_than(r, l, op);
                }
                if (op == "<=") {
                    return !less_than(r, l, op);
                }
                if (op == ">=") {
                    return !less_than(l, r, op);
                }
                if (op == "in") {
                    return contains(r, l);
                }
                if (op == "not in") {
                    return !contains(r, l);
                }

                if (op == "+") {
                    if (l.is_string() && r.is_string()) {
                        return l.as_string() + r.as_string();
                    }
                    if (l.is_list() && r.is_list()) {
                        auto out = l.as_list();
                        out.insert(out.end(), r.as_list().begin(), r.as_list().end());
                        return value::list(std::move(out));
                    }
                    if (l.is_int() && r.is_int()) {
                        return arithmetic(op, l.as_int(), r.as_int());
                    }
                    throw script_error{
                            errors::type_error,
                            "unsupported operand types for +: {} and {}"_format(l.type_name(), r.type_name())};
                }
                if (op == "*") {
                    if ((l.is_string() || l.is_list()) && r.is_int()) {
                        return repeat(l, r.as_int());
                    }
                    return arithmetic(op, checked_int(l, op), checked_int(r, op));
                }
                return arithmetic(op, checked_int(l, op), checked_int(r, op));
            }
        };

        struct attribute_expr final : expression {
            expression_ptr base{};
            std::string name{};

            value eval(execution_context& ctx) const override {
                auto target = base->eval(ctx);
                if (target.is_object()) {
                    if (auto attr = target.as_object()->get_attr(name)) {
                        return *attr;
                    }
                }
                throw script_error{
                        errors::attribute_error, "'{}' has no attribute '{}'"_format(target.type_name(), name)};
            }
        };

        static std::size_t normalize_index(int64_t index, std::size_t size) {
            auto resolved = index < 0 ? index + static_cast<int64_t>(size) : index;
            if (resolved < 0 || resolved >= static_cast<int64_t>(size)) {
                throw script_error{errors::index_error, "index {} out of range"_format(index)};
            }
            return static_cast<std::size_t>(resolved);
        }

        struct index_expr final : expression {
            expression_ptr base{};
            expression_ptr index{};

            value eval(execution_context& ctx) const override {
                auto target = base->eval(ctx);
                auto key = index->eval(ctx);
                if (target.is_list()) {
                    const auto& items = target.as_list();
                    return items[normalize_index(checked_int(key, "[]"), items.size())];
                }
                if (target.is_string()) {
                    const auto& text = target.as_string();
                    return std::string(1U, text[normalize_index(checked_int(key, "[]"), text.size())]);
                }
                if (target.is_map()) {
                    const auto& entries = target.as_map();
                    auto it = entries.find(key.as_string());
                    if (it == entries.end()) {
                        throw script_error{errors::key_error, repr(key)};
                    }
                    return it->second;
                }
                throw script_error{errors::type_error, "{} is not subscriptable"_format(target.type_name())};
            }
        };

        struct call_argument {
            std::optional<std::string> keyword{};
            expression_ptr expr{};
        };

        static value string_method(const std::string& self, std::string_view name, arguments& args) {
            auto text = std::string_view{self};
            if (name == "strip") {
                return utils::trim_view(text);
            }
            if (name == "lstrip") {
                auto first = text.find_first_not_of(" \t\r\n");
                return first == std::string_view::npos ? std::string_view{} : text.substr(first);
            }
            if (name == "rstrip") {
                auto last = text.find_last_not_of(" \t\r\n");
                return last == std::string_view::npos ? std::string_view{} : text.substr(0U, last + 1U);
            }
            if (name == "upper" || name == "lower") {
                std::string out{self};
                for (auto& c : out) {
                    c = name == "upper" ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
                                        : utils::char_tolower(c);
                }
                return out;
            }
            if (name == "startswith") {
                return text.starts_with(args.require(0U, "prefix", name).as_string());
            }
            if (name == "endswith") {
                return text.ends_with(args.require(0U, "suffix", name).as_string());
            }
            if (name == "replace") {
                auto from = args.require(0U, "old", name).as_string();
                auto to = args.require(1U, "new", name).as_string();
                if (from.empty()) {
                    return self;
                }
                std::string out{};
                std::size_t pos = 0U;
                while (true) {
                    auto hit = text.find(from, pos);
                    if (hit == std::string_view::npos) {
                        out.append(text.substr(pos));
                        break;
                    }
                    out.append(text.substr(pos, hit - pos));
                    out.append(to);
                    pos = hit + from.size();
                }
                return out;
            }
            if (name == "splitlines") {
                std::vector<value> out{};
                for (auto& line : utils::split_lines(text)) {
                    out.emplace_back(std::move(line));
                }
                return value::list(std::move(out));
            }
            if (name == "split") {
                std::vector<value> out{};
                auto sep = args.get(0U, "sep");
                if (!sep || sep->is_none()) {
                    std::size_t pos = 0U;
                    while (true) {
                        auto start = text.find_first_not_of(" \t\r\n", pos);
                        if (start == std::string_view::npos) {
                            break;
                        }
                        auto end = text.find_first_of(" \t\r\n", start);
                        out.emplace_back(text.substr(start, end == std::string_view::npos ? end : end - start));
                        if (end == std::string_view::npos) {
                            break;
                        }
                        pos = end;
                    }
                    return value::list(std::move(out));
                }
                const auto& delim = sep->as_string();
                if (delim.empty()) {
                    throw script_error{errors::value_error, "empty separator"};
                }
                std::size_t pos = 0U;
                while (true) {
                    auto hit = text.find(delim, pos);
                    out.emplace_back(text.substr(pos, hit == std::string_view::npos ? hit : hit - pos));
                    if (hit == std::string_view::npos) {
                        break;
                    }
                    pos = hit + delim.size();
                }
                return value::list(std::move(out));
            }
            if (name == "join") {
                std::vector<std::string> parts{};
                for (const auto& item : args.require(0U, "items", name).as_list()) {
                    parts.push_back(item.as_string());
                }
                return utils::join_with_separator(parts, text);
            }
            throw script_error{errors::attribute_error, "'string' has no attribute '{}'"_format(name)};
        }

        static value list_method(const value& self, std::string_view name, arguments& args) {
            auto& items = self.as_list();
            if (name == "append") {
                items.push_back(args.require(0U, "item", name));
                return none;
            }
            if (name == "extend") {
                auto more = args.require(0U, "items", name).as_list();
                items.insert(items.end(), more.begin(), more.end());
                return none;
            }
            if (name == "pop") {
                if (items.empty()) {
                    throw script_error{errors::index_error, "pop from empty list"};
                }
                auto index = args.get(0U, "index");
                auto at = normalize_index(index ? index->as_int() : -1, items.size());
                auto out = items[at];
                items.erase(items.begin() + static_cast<std::ptrdiff_t>(at));
                return out;
            }
            throw script_error{errors::attribute_error, "'list' has no attribute '{}'"_format(name)};
        }

        static value map_method(const value& self, std::string_view name, arguments& args) {
            auto& entries = self.as_map();
            if (name == "get") {
                auto key = args.require(0U, "key", name).as_string();
                if (auto it = entries.find(key); it != entries.end()) {
                    return it->second;
                }
                return args.get(1U, "default").value_or(value{});
            }
            if (name == "keys" || name == "values" || name == "items") {
                std::vector<value> out{};
                for (const auto& [key, item] : entries) {
                    if (name == "keys") {
                        out.emplace_back(key);
                    }
                    else if (name == "values") {
                        out.push_back(item);
                    }
                    else {
                        out.push_back(value::list({value{key}, item}));
                    }
                }
                return value::list(std::move(out));
            }
            throw script_error{errors::attribute_error, "'map' has no attribute '{}'"_format(name)};
        }

        struct call_expr final : expression {
            expression_ptr callee{};
            std::vector<call_argument> args{};

            value eval(execution_context& ctx) const override {
                if (auto* method = dynamic_cast<const attribute_expr*>(callee.get())) {
                    auto self = method->base->eval(ctx);
                    auto call_args = evaluate_args(ctx);
                    return invoke_method(self, method->name, call_args, ctx);
                }
                auto target = callee->eval(ctx);
                auto call_args = evaluate_args(ctx);
                return call(target, call_args, ctx);
            }

          private:
            arguments evaluate_args(execution_context& ctx) const {
                arguments out{};
                for (const auto& arg : args) {
                    auto v = arg.expr->eval(ctx);
                    if (arg.keyword) {
                        out.keywords.emplace_back(*arg.keyword, std::move(v));
                    }
                    else {
                        out.positional.push_back(std::move(v));
                    }
                }
                return out;
            }

            static value invoke_method(
                    const value& self, const std::string& name, arguments& args, execution_context& ctx) {
                if (self.is_string()) {
                    return string_method(self.as_string(), name, args);
                }
                if (self.is_list()) {
                    return list_method(self, name, args);
                }
                if (self.is_map()) {
                    return map_method(self, name, args);
                }
                if (self.is_object()) {
                    const auto& obj = self.as_object();
                    if (auto result = obj->call_method(name, args, ctx)) {
                        return *result;
                    }
                    if (auto attr = obj->get_attr(name)) {
                        return call(*attr, args, ctx);
                    }
                }
                throw script_error{
                        errors::attribute_error, "'{}' has no attribute '{}'"_format(self.type_name(), name)};
            }
        };

    }  // namespace detail

    namespace detail {

        // -- statements --------------------------------------------------------------------

        struct statement {
            virtual ~statement() = default;
            virtual void exec(execution_context& ctx) const = 0;
        };

        using statement_ptr = std::unique_ptr<statement>;

        struct expression_stmt final : statement {
            expression_ptr expr{};

            void exec(execution_context& ctx) const override {
                auto v = expr->eval(ctx);
                if (!v.is_none()) {
                    ctx.out() << repr(v) << '\n';
                }
            }
        };

        struct assign_stmt final : statement {
            std::vector<std::string> targets{};
            expression_ptr expr{};

            void exec(execution_context& ctx) const override {
                auto v = expr->eval(ctx);
                if (targets.size() == 1U) {
                    ctx.names().assign(targets.front(), std::move(v));
                    return;
                }
                if (!v.is_list()) {
                    throw script_error{errors::type_error, "cannot unpack {}"_format(v.type_name())};
                }
                const auto& items = v.as_list();
                if (items.size() != targets.size()) {
                    throw script_error{
                            errors::value_error,
                            "expected {} values to unpack, got {}"_format(targets.size(), items.size())};
                }
                for (std::size_t i = 0U; i < targets.size(); ++i) {
                    ctx.names().assign(targets[i], items[i]);
                }
            }
        };

        // base.attr = expr
        struct attribute_assign_stmt final : statement {
            expression_ptr base{};
            std::string name{};
            expression_ptr expr{};

            void exec(execution_context& ctx) const override {
                auto target = base->eval(ctx);
                auto v = expr->eval(ctx);
                if (!target.is_object() || !target.as_object()->set_attr(name, std::move(v))) {
                    throw script_error{
                            errors::attribute_error,
                            "cannot set attribute '{}' on {}"_format(name, target.type_name())};
                }
            }
        };

        struct unwind_on_exit {
            resource_stack& stack;
            std::size_t depth;

            ~unwind_on_exit() { stack.unwind_to(depth); }
        };

        struct with_stmt final : statement {
            expression_ptr resource{};
            std::optional<std::string> alias{};
            std::vector<statement_ptr> body{};

            void exec(execution_context& ctx) const override {
                auto v = resource->eval(ctx);
                auto guard = v.is_object() ? v.as_object()->guard() : nullptr;
                if (!guard) {
                    throw script_error{errors::type_error, "{} cannot be used in a with block"_format(v.type_name())};
                }

                unwind_on_exit unwind{ctx.resources(), ctx.resources().depth()};
                ctx.resources().push(std::move(guard));
                if (alias) {
                    ctx.names().assign(*alias, v);
                }
                for (const auto& stmt : body) {
                    stmt->exec(ctx);
                }
            }
        };

        // -- parser ------------------------------------------------------------------------

        class parser {
          public:
            parser(std::vector<token> tokens, std::string_view origin) : tokens_{std::move(tokens)}, origin_{origin} {}

            std::vector<statement_ptr> parse_statements(bool in_block) {
                std::vector<statement_ptr> out{};
                skip_separators();
                while (true) {
                    if (peek().kind == token_kind::end) {
                        if (in_block) {
                            fail("expected '}' before end of input");
                        }
                        break;
                    }
                    if (in_block && is_op("}")) {
                        break;
                    }
                    out.push_back(parse_statement());
                    if (!is_op("}") && peek().kind != token_kind::end) {
                        if (!is_separator()) {
                            fail("unexpected '{}'"_format(peek().text));
                        }
                    }
                    skip_separators();
                }
                return out;
            }

            expression_ptr parse_lone_expression() {
                skip_separators();
                auto expr = parse_expression();
                skip_separators();
                if (peek().kind != token_kind::end) {
                    fail("unexpected '{}'"_format(peek().text));
                }
                return expr;
            }

          private:
            const token& peek() {
                if (nesting_ > 0) {
                    while (tokens_[pos_].kind == token_kind::newline) {
                        ++pos_;
                    }
                }
                return tokens_[pos_];
            }

            const token& peek_at(std::size_t offset) const {
                return tokens_[std::min(pos_ + offset, tokens_.size() - 1U)];
            }

            token advance() {
                auto t = peek();
                if (pos_ < tokens_.size() - 1U) {
                    ++pos_;
                }
                return t;
            }

            bool is_op(std::string_view op) { return peek().kind == token_kind::op && peek().text == op; }
            bool is_keyword(std::string_view kw) { return peek().kind == token_kind::keyword && peek().text == kw; }
            bool is_separator() { return peek().kind == token_kind::newline || is_op(";"); }

            void skip_separators() {
                while (is_separator()) {
                    advance();
                }
            }

            [[noreturn]] void fail(std::string_view message) { syntax_error(origin_, peek().line, message); }

            void expect_op(std::string_view op) {
                if (!is_op(op)) {
                    fail("expected '{}'"_format(op));
                }
                advance();
            }

            std::string expect_identifier() {
                if (peek().kind != token_kind::identifier) {
                    fail("expected a name");
                }
                return advance().text;
            }

            // NAME {, NAME} '='
            bool at_assignment() const {
                std::size_t offset = 0U;
                while (true) {
                    if (peek_at(offset).kind != token_kind::identifier) {
                        return false;
                    }
                    const auto& next = peek_at(offset + 1U);
                    if (next.kind == token_kind::op && next.text == "=") {
                        return true;
                    }
                    if (next.kind != token_kind::op || next.text != ",") {
                        return false;
                    }
                    offset += 2U;
                }
            }

            // NAME {'.' NAME} '.' NAME '='
            std::size_t attribute_assignment_length() const {
                if (peek_at(0U).kind != token_kind::identifier) {
                    return 0U;
                }
                std::size_t offset = 1U;
                while (true) {
                    const auto& dot = peek_at(offset);
                    if (dot.kind != token_kind::op || dot.text != "." ||
                        peek_at(offset + 1U).kind != token_kind::identifier) {
                        break;
                    }
                    offset += 2U;
                }
                const auto& eq = peek_at(offset);
                if (offset == 1U || eq.kind != token_kind::op || eq.text != "=") {
                    return 0U;
                }
                return offset;
            }

            statement_ptr parse_statement() {
                if (is_keyword("with")) {
                    return parse_with();
                }
                if (auto length = attribute_assignment_length(); length > 0U) {
                    auto stmt = std::make_unique<attribute_assign_stmt>();
                    expression_ptr base = std::make_unique<name_expr>(expect_identifier());
                    // all but the final attribute name the object being assigned into
                    for (std::size_t consumed = 1U; consumed + 2U < length; consumed += 2U) {
                        expect_op(".");
                        auto attr = std::make_unique<attribute_expr>();
                        attr->base = std::move(base);
                        attr->name = expect_identifier();
                        base = std::move(attr);
                    }
                    expect_op(".");
                    stmt->base = std::move(base);
                    stmt->name = expect_identifier();
                    expect_op("=");
                    stmt->expr = parse_expression();
                    return stmt;
                }
                if (at_assignment()) {
                    auto stmt = std::make_unique<assign_stmt>();
                    stmt->targets.push_back(expect_identifier());
                    while (is_op(",")) {
                        advance();
                        stmt->targets.push_back(expect_identifier());
                    }
                    expect_op("=");
                    stmt->expr = parse_expression();
                    return stmt;
                }
                auto stmt = std::make_unique<expression_stmt>();
                stmt->expr = parse_expression();
                return stmt;
            }

            statement_ptr parse_with() {
                advance();
                auto stmt = std::make_unique<with_stmt>();
                stmt->resource = parse_expression();
                if (is_keyword("as")) {
                    advance();
                    stmt->alias = expect_identifier();
                }
                expect_op("{");
                auto saved = nesting_;
                nesting_ = 0;
                stmt->body = parse_statements(true);
                expect_op("}");
                nesting_ = saved;
                return stmt;
            }

            expression_ptr parse_expression() { return parse_or(); }

            expression_ptr make_binary(std::string op, expression_ptr lhs, expression_ptr rhs) {
                auto expr = std::make_unique<binary_expr>();
                expr->op = std::move(op);
                expr->lhs = std::move(lhs);
                expr->rhs = std::move(rhs);
                return expr;
            }

            expression_ptr parse_or() {
                auto lhs = parse_and();
                while (is_keyword("or")) {
                    advance();
                    lhs = make_binary("or", std::move(lhs), parse_and());
                }
                return lhs;
            }

            expression_ptr parse_and() {
                auto lhs = parse_not();
                while (is_keyword("and")) {
                    advance();
                    lhs = make_binary("and", std::move(lhs), parse_not());
                }
                return lhs;
            }

            expression_ptr parse_not() {
                if (is_keyword("not")) {
                    advance();
                    auto expr = std::make_unique<unary_expr>();
                    expr->op = "not";
                    expr->operand = parse_not();
                    return expr;
                }
                return parse_comparison();
            }

            expression_ptr parse_comparison() {
                auto lhs = parse_additive();
                static constexpr std::string_view comparison_ops[] = {"=="sv, "!="sv, "<"sv, "<="sv, ">"sv, ">="sv};
                for (auto op : comparison_ops) {
                    if (is_op(op)) {
                        advance();
                        return make_binary(std::string{op}, std::move(lhs), parse_additive());
                    }
                }
                if (is_keyword("in")) {
                    advance();
                    return make_binary("in", std::move(lhs), parse_additive());
                }
                if (is_keyword("not") && peek_at(1U).kind == token_kind::keyword && peek_at(1U).text == "in") {
                    advance();
                    advance();
                    return make_binary("not in", std::move(lhs), parse_additive());
                }
                return lhs;
            }

            expression_ptr parse_additive() {
                auto lhs = parse_term();
                while (is_op("+") || is_op("-")) {
                    auto op = advance().text;
                    lhs = make_binary(std::move(op), std::move(lhs), parse_term());
                }
                return lhs;
            }

            expression_ptr parse_term() {
                auto lhs = parse_unary();
                while (is_op("*") || is_op("/") || is_op("%")) {
                    auto op = advance().text;
                    lhs = make_binary(std::move(op), std::move(lhs), parse_unary());
                }
                return lhs;
            }

            expression_ptr parse_unary() {
                if (is_op("-")) {
                    advance();
                    auto expr = std::make_unique<unary_expr>();
                    expr->op = "-";
                    expr->operand = parse_unary();
                    return expr;
                }
                return parse_postfix();
            }

            expression_ptr parse_postfix() {
                auto expr = parse_primary();
                while (true) {
                    if (is_op("(")) {
                        expr = parse_call(std::move(expr));
                    }
                    else if (is_op(".")) {
                        advance();
                        auto attr = std::make_unique<attribute_expr>();
                        attr->base = std::move(expr);
                        attr->name = expect_identifier();
                        expr = std::move(attr);
                    }
                    else if (is_op("[")) {
                        advance();
                        ++nesting_;
                        auto idx = std::make_unique<index_expr>();
                        idx->base = std::move(expr);
                        idx->index = parse_expression();
                        --nesting_;
                        expect_op("]");
                        expr = std::move(idx);
                    }
                    else {
                        return expr;
                    }
                }
            }

            expression_ptr parse_call(expression_ptr callee) {
                advance();
                ++nesting_;
                auto call = std::make_unique<call_expr>();
                call->callee = std::move(callee);
                bool seen_keyword = false;
                while (!is_op(")")) {
                    call_argument arg{};
                    auto is_name = peek().kind == token_kind::identifier;
                    const auto& next = peek_at(1U);
                    if (is_name && next.kind == token_kind::op && next.text == "=") {
                        arg.keyword = advance().text;
                        advance();
                        seen_keyword = true;
                    }
                    else if (seen_keyword) {
                        fail("positional argument follows keyword argument");
                    }
                    arg.expr = parse_expression();
                    call->args.push_back(std::move(arg));
                    if (!is_op(",")) {
                        break;
                    }
                    advance();
                }
                --nesting_;
                expect_op(")");
                return call;
            }

            expression_ptr parse_primary() {
                const auto& t = peek();
                switch (t.kind) {
                    case token_kind::integer: {
                        auto v = t.number;
                        advance();
                        return std::make_unique<literal_expr>(value{v});
                    }
                    case token_kind::string: {
                        auto text = advance().text;
                        return std::make_unique<literal_expr>(value{std::move(text)});
                    }
                    case token_kind::identifier:
                        return std::make_unique<name_expr>(advance().text);
                    case token_kind::keyword:
                        if (t.text == "true" || t.text == "false") {
                            auto b = t.text == "true";
                            advance();
                            return std::make_unique<literal_expr>(value{b});
                        }
                        if (t.text == "none") {
                            advance();
                            return std::make_unique<literal_expr>(value{});
                        }
                        break;
                    case token_kind::op:
                        if (t.text == "(") {
                            advance();
                            ++nesting_;
                            auto inner = parse_expression();
                            --nesting_;
                            expect_op(")");
                            return inner;
                        }
                        if (t.text == "[") {
                            return parse_list();
                        }
                        if (t.text == "{") {
                            return parse_map();
                        }
                        break;
                    case token_kind::newline:
                    case token_kind::end:
                        fail("unexpected end of input");
                }
                fail("unexpected '{}'"_format(t.text));
            }

            expression_ptr parse_list() {
                advance();
                ++nesting_;
                auto list = std::make_unique<list_expr>();
                while (!is_op("]")) {
                    list->items.push_back(parse_expression());
                    if (!is_op(",")) {
                        break;
                    }
                    advance();
                }
                --nesting_;
                expect_op("]");
                return list;
            }

            expression_ptr parse_map() {
                advance();
                ++nesting_;
                auto map = std::make_unique<map_expr>();
                while (!is_op("}")) {
                    auto key = parse_expression();
                    expect_op(":");
                    auto item = parse_expression();
                    map->entries.emplace_back(std::move(key), std::move(item));
                    if (!is_op(",")) {
                        break;
                    }
                    advance();
                }
                --nesting_;
                expect_op("}");
                return map;
            }

            std::vector<token> tokens_;
            std::string_view origin_;
            std::size_t pos_{0U};
            int nesting_{0};
        };

    }  // namespace detail

    std::optional<value> symbol_table::lookup(std::string_view name) const {
        if (auto it = bindings_.find(name); it != bindings_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    void symbol_table::assign(std::string name, value v) {
        bindings_.insert_or_assign(std::move(name), std::move(v));
    }

    bool symbol_table::contains(std::string_view name) const {
        return bindings_.find(name) != bindings_.end();
    }

    bool symbol_table::erase(std::string_view name) {
        if (auto it = bindings_.find(name); it != bindings_.end()) {
            bindings_.erase(it);
            return true;
        }
        return false;
    }

    std::vector<std::string> symbol_table::names() const {
        std::vector<std::string> out{};
        out.reserve(bindings_.size());
        for (const auto& [name, _] : bindings_) {
            out.push_back(name);
        }
        return out;
    }

    execution_context::execution_context(
            symbol_table& names, runtime_environment& env, std::ostream& out, std::ostream& err)
            : names_{names}, env_{env}, out_{&out}, err_{&err} {}

    program::program() = default;
    program::program(program&&) noexcept = default;
    program& program::operator=(program&&) noexcept = default;
    program::~program() = default;

    program parse_program(std::string_view source, std::string_view origin) {
        detail::lexer lex{source, origin};
        detail::parser p{lex.tokenize(), origin};
        program prog{};
        prog.statements_ = p.parse_statements(false);
        return prog;
    }

    void execute(const program& prog, execution_context& ctx) {
        for (const auto& stmt : prog.statements_) {
            stmt->exec(ctx);
        }
    }

    void evaluate(std::string_view source, execution_context& ctx, std::string_view origin) {
        execute(parse_program(source, origin), ctx);
    }

    value evaluate_expression(std::string_view source, execution_context& ctx) {
        detail::lexer lex{source, "<expression>"sv};
        detail::parser p{lex.tokenize(), "<expression>"sv};
        return p.parse_lone_expression()->eval(ctx);
    }

    value call(const value& callee, arguments& args, execution_context& ctx) {
        if (callee.is_function()) {
            const auto& fn = callee.as_function();
            return fn.fn(args, ctx);
        }
        throw script_error{errors::type_error, "{} is not callable"_format(callee.type_name())};
    }

    bool input_is_complete(std::string_view source) {
        int depth = 0;
        char quote = '\0';
        bool escape_next = false;
        bool in_comment = false;

        for (auto c : source) {
            if (in_comment) {
                in_comment = c != '\n';
                continue;
            }
            if (quote != '\0') {
                if (escape_next) {
                    escape_next = false;
                }
                else if (c == '\\') {
                    escape_next = true;
                }
                else if (c == quote || c == '\n') {
                    quote = '\0';
                }
                continue;
            }
            switch (c) {
                case '#':
                    in_comment = true;
                    break;
                case '"':
                case '\'':
                    quote = c;
                    break;
                case '(':
                case '[':
                case '{':
                    ++depth;
                    break;
                case ')':
                case ']':
                case '}':
                    --depth;
                    break;
                default:
                    break;
            }
        }
        return depth <= 0 && quote == '\0';
    }

}  // namespace litmus::script
