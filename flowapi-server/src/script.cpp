/**
 * @file script.cpp
 * @brief Lexer, parser and tree-walking evaluator for transformer scripts
 */

#include "script.hpp"
#include "errors.hpp"
#include <map>
#include <limits>
#include <cctype>
#include <cstdint>
#include <algorithm>

namespace flowapi {
namespace script {

namespace {

// ===========================================================================
// Lexer
// ===========================================================================

enum class TokenKind {
    Number,
    String,
    Identifier,
    Operator,
    Newline,
    End
};

struct Token {
    TokenKind kind;
    std::string text;
    Value number;
    int line;
};

const char* const TWO_CHAR_OPERATORS[] = {"==", "!=", "<=", ">=", "&&", "||"};
const std::string SINGLE_CHAR_OPERATORS = "=<>+-*/%!?:.,;()[]{}";

std::vector<Token> tokenize(const std::string& source) {
    std::vector<Token> tokens;
    int line = 1;
    int nesting = 0;    // ( and [ depth; newlines inside them are not separators
    size_t pos = 0;

    while (pos < source.size()) {
        char c = source[pos];

        if (c == '\n') {
            if (nesting == 0) {
                tokens.push_back({TokenKind::Newline, "\n", Value(), line});
            }
            ++line;
            ++pos;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos;
            continue;
        }
        if (c == '#') {
            while (pos < source.size() && source[pos] != '\n') ++pos;
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t start = pos;
            bool is_float = false;
            while (pos < source.size() && std::isdigit(static_cast<unsigned char>(source[pos]))) ++pos;
            if (pos + 1 < source.size() && source[pos] == '.' &&
                std::isdigit(static_cast<unsigned char>(source[pos + 1]))) {
                is_float = true;
                ++pos;
                while (pos < source.size() && std::isdigit(static_cast<unsigned char>(source[pos]))) ++pos;
            }
            if (pos < source.size() && (source[pos] == 'e' || source[pos] == 'E')) {
                size_t exp_pos = pos + 1;
                if (exp_pos < source.size() && (source[exp_pos] == '+' || source[exp_pos] == '-')) ++exp_pos;
                if (exp_pos < source.size() && std::isdigit(static_cast<unsigned char>(source[exp_pos]))) {
                    is_float = true;
                    pos = exp_pos;
                    while (pos < source.size() && std::isdigit(static_cast<unsigned char>(source[pos]))) ++pos;
                }
            }

            std::string text = source.substr(start, pos - start);
            Token token{TokenKind::Number, text, Value(), line};
            if (is_float) {
                token.number = std::stod(text);
            } else {
                try {
                    token.number = static_cast<int64_t>(std::stoll(text));
                } catch (const std::out_of_range&) {
                    token.number = std::stod(text);
                }
            }
            tokens.push_back(token);
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t start = pos;
            while (pos < source.size() &&
                   (std::isalnum(static_cast<unsigned char>(source[pos])) || source[pos] == '_')) {
                ++pos;
            }
            tokens.push_back({TokenKind::Identifier, source.substr(start, pos - start), Value(), line});
            continue;
        }

        if (c == '"' || c == '\'') {
            char quote = c;
            int start_line = line;
            std::string text;
            ++pos;
            bool closed = false;
            while (pos < source.size()) {
                char ch = source[pos++];
                if (ch == quote) {
                    closed = true;
                    break;
                }
                if (ch == '\n') {
                    throw ScriptSyntaxError(start_line, "unterminated string literal");
                }
                if (ch == '\\') {
                    if (pos >= source.size()) break;
                    char esc = source[pos++];
                    switch (esc) {
                        case 'n': text += '\n'; break;
                        case 't': text += '\t'; break;
                        case 'r': text += '\r'; break;
                        case '\\': text += '\\'; break;
                        case '"': text += '"'; break;
                        case '\'': text += '\''; break;
                        case '/': text += '/'; break;
                        default:
                            throw ScriptSyntaxError(line, std::string("unknown escape sequence \\") + esc);
                    }
                    continue;
                }
                text += ch;
            }
            if (!closed) {
                throw ScriptSyntaxError(start_line, "unterminated string literal");
            }
            tokens.push_back({TokenKind::String, text, Value(), start_line});
            continue;
        }

        bool matched = false;
        for (const char* op : TWO_CHAR_OPERATORS) {
            if (source.compare(pos, 2, op) == 0) {
                tokens.push_back({TokenKind::Operator, op, Value(), line});
                pos += 2;
                matched = true;
                break;
            }
        }
        if (matched) continue;

        if (SINGLE_CHAR_OPERATORS.find(c) != std::string::npos) {
            if (c == '(' || c == '[') ++nesting;
            if ((c == ')' || c == ']') && nesting > 0) --nesting;
            tokens.push_back({TokenKind::Operator, std::string(1, c), Value(), line});
            ++pos;
            continue;
        }

        throw ScriptSyntaxError(line, std::string("unexpected character '") + c + "'");
    }

    tokens.push_back({TokenKind::End, "", Value(), line});
    return tokens;
}

// ===========================================================================
// Value helpers
// ===========================================================================

[[noreturn]] void fail(int line, const std::string& message) {
    throw ScriptError("line " + std::to_string(line) + ": " + message);
}

bool both_integers(const Value& a, const Value& b) {
    return a.is_number_integer() && b.is_number_integer();
}

double to_double(const Value& v) {
    return v.get<double>();
}

int64_t to_int(const Value& v) {
    return v.get<int64_t>();
}

std::string dump_value(const Value& v, int line) {
    try {
        return v.dump(-1, ' ', false, Value::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        fail(line, std::string("cannot serialize value: ") + e.what());
    }
}

} // namespace

bool is_truthy(const Value& value) {
    switch (value.type()) {
        case Value::value_t::null: return false;
        case Value::value_t::boolean: return value.get<bool>();
        case Value::value_t::number_integer: return value.get<int64_t>() != 0;
        case Value::value_t::number_unsigned: return value.get<uint64_t>() != 0;
        case Value::value_t::number_float: return value.get<double>() != 0.0;
        case Value::value_t::string: return !value.get_ref<const std::string&>().empty();
        case Value::value_t::array:
        case Value::value_t::object: return !value.empty();
        default: return true;
    }
}

// ===========================================================================
// AST
// ===========================================================================

struct Scope {
    Value& data;
    Value& state;
    const Value& config;
};

namespace {

class Expr {
public:
    explicit Expr(int line) : line_(line) {}
    virtual ~Expr() = default;
    virtual Value evaluate(Scope& scope) const = 0;
    int line() const { return line_; }

protected:
    int line_;
};

using ExprPtr = std::unique_ptr<Expr>;

class LiteralExpr : public Expr {
public:
    LiteralExpr(int line, Value value) : Expr(line), value_(std::move(value)) {}
    Value evaluate(Scope&) const override { return value_; }

private:
    Value value_;
};

class ArrayExpr : public Expr {
public:
    ArrayExpr(int line, std::vector<ExprPtr> items) : Expr(line), items_(std::move(items)) {}

    Value evaluate(Scope& scope) const override {
        Value result = Value::array();
        for (const auto& item : items_) {
            result.push_back(item->evaluate(scope));
        }
        return result;
    }

private:
    std::vector<ExprPtr> items_;
};

class ObjectExpr : public Expr {
public:
    ObjectExpr(int line, std::vector<std::pair<std::string, ExprPtr>> members)
        : Expr(line), members_(std::move(members)) {}

    Value evaluate(Scope& scope) const override {
        Value result = Value::object();
        for (const auto& [key, expr] : members_) {
            result[key] = expr->evaluate(scope);
        }
        return result;
    }

private:
    std::vector<std::pair<std::string, ExprPtr>> members_;
};

enum class Root { Data, State, Config };

struct PathKey {
    bool is_index;
    std::string name;
    int64_t index;
};

struct PathSegment {
    std::string name;       // Used when index is null
    ExprPtr index;
};

class PathExpr : public Expr {
public:
    PathExpr(int line, Root root, std::vector<PathSegment> segments)
        : Expr(line), root_(root), segments_(std::move(segments)) {}

    Root root() const { return root_; }

    Value evaluate(Scope& scope) const override {
        std::vector<PathKey> keys = resolve_keys(scope);
        const Value* current = &root_value(scope);

        for (const PathKey& key : keys) {
            if (!key.is_index && current->is_object()) {
                auto it = current->find(key.name);
                if (it == current->end()) return Value();
                current = &*it;
            } else if (key.is_index && current->is_array()) {
                if (key.index < 0 || static_cast<size_t>(key.index) >= current->size()) return Value();
                current = &(*current)[static_cast<size_t>(key.index)];
            } else {
                return Value();
            }
        }
        return *current;
    }

    void assign(Scope& scope, Value value) const {
        std::vector<PathKey> keys = resolve_keys(scope);
        Value* current = &mutable_root(scope);

        for (const PathKey& key : keys) {
            if (!key.is_index) {
                if (current->is_null()) *current = Value::object();
                if (!current->is_object()) {
                    fail(line_, "cannot set key '" + key.name + "' on " + current->type_name() +
                                " in " + describe());
                }
                current = &(*current)[key.name];
            } else {
                if (current->is_null()) *current = Value::array();
                if (!current->is_array()) {
                    fail(line_, "cannot set index " + std::to_string(key.index) + " on " +
                                current->type_name() + " in " + describe());
                }
                if (key.index < 0 || static_cast<size_t>(key.index) > current->size()) {
                    fail(line_, "index " + std::to_string(key.index) + " out of range in " + describe());
                }
                if (static_cast<size_t>(key.index) == current->size()) {
                    current->push_back(Value());
                }
                current = &(*current)[static_cast<size_t>(key.index)];
            }
        }
        *current = std::move(value);
    }

    void erase(Scope& scope) const {
        std::vector<PathKey> keys = resolve_keys(scope);
        if (keys.empty()) {
            mutable_root(scope) = Value::object();
            return;
        }

        Value* current = &mutable_root(scope);
        for (size_t i = 0; i + 1 < keys.size(); ++i) {
            const PathKey& key = keys[i];
            if (!key.is_index && current->is_object()) {
                auto it = current->find(key.name);
                if (it == current->end()) return;
                current = &*it;
            } else if (key.is_index && current->is_array()) {
                if (key.index < 0 || static_cast<size_t>(key.index) >= current->size()) return;
                current = &(*current)[static_cast<size_t>(key.index)];
            } else {
                return;
            }
        }

        const PathKey& last = keys.back();
        if (!last.is_index && current->is_object()) {
            current->erase(last.name);
        } else if (last.is_index && current->is_array() &&
                   last.index >= 0 && static_cast<size_t>(last.index) < current->size()) {
            current->erase(static_cast<size_t>(last.index));
        }
    }

    std::string describe() const {
        std::string text = root_ == Root::Data ? "data" : (root_ == Root::State ? "state" : "config");
        for (const auto& segment : segments_) {
            text += segment.index ? "[...]" : "." + segment.name;
        }
        return text;
    }

private:
    Root root_;
    std::vector<PathSegment> segments_;

    const Value& root_value(Scope& scope) const {
        switch (root_) {
            case Root::Data: return scope.data;
            case Root::State: return scope.state;
            default: return scope.config;
        }
    }

    Value& mutable_root(Scope& scope) const {
        if (root_ == Root::Data) return scope.data;
        if (root_ == Root::State) return scope.state;
        fail(line_, "config is read-only");
    }

    std::vector<PathKey> resolve_keys(Scope& scope) const {
        std::vector<PathKey> keys;
        keys.reserve(segments_.size());
        for (const auto& segment : segments_) {
            if (!segment.index) {
                keys.push_back({false, segment.name, 0});
                continue;
            }
            Value key = segment.index->evaluate(scope);
            if (key.is_string()) {
                keys.push_back({false, key.get<std::string>(), 0});
            } else if (key.is_number_integer()) {
                keys.push_back({true, "", key.get<int64_t>()});
            } else {
                fail(line_, std::string("path index must be a string or integer, got ") + key.type_name());
            }
        }
        return keys;
    }
};

enum class UnaryOp { Not, Negate };

class UnaryExpr : public Expr {
public:
    UnaryExpr(int line, UnaryOp op, ExprPtr operand)
        : Expr(line), op_(op), operand_(std::move(operand)) {}

    Value evaluate(Scope& scope) const override {
        Value value = operand_->evaluate(scope);
        if (op_ == UnaryOp::Not) {
            return !is_truthy(value);
        }
        if (value.is_number_integer()) return -to_int(value);
        if (value.is_number_float()) return -to_double(value);
        fail(line_, std::string("cannot negate ") + value.type_name());
    }

private:
    UnaryOp op_;
    ExprPtr operand_;
};

enum class BinaryOp { Add, Sub, Mul, Div, Mod, Eq, Ne, Lt, Le, Gt, Ge };

class BinaryExpr : public Expr {
public:
    BinaryExpr(int line, BinaryOp op, ExprPtr lhs, ExprPtr rhs)
        : Expr(line), op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

    Value evaluate(Scope& scope) const override {
        Value a = lhs_->evaluate(scope);
        Value b = rhs_->evaluate(scope);

        switch (op_) {
            case BinaryOp::Eq: return a == b;
            case BinaryOp::Ne: return a != b;
            case BinaryOp::Add: return add(a, b);
            case BinaryOp::Lt:
            case BinaryOp::Le:
            case BinaryOp::Gt:
            case BinaryOp::Ge: return compare(a, b);
            default: return arithmetic(a, b);
        }
    }

private:
    BinaryOp op_;
    ExprPtr lhs_;
    ExprPtr rhs_;

    Value add(const Value& a, const Value& b) const {
        if (a.is_number() && b.is_number()) {
            if (both_integers(a, b)) return to_int(a) + to_int(b);
            return to_double(a) + to_double(b);
        }
        if (a.is_string() && b.is_string()) {
            return a.get<std::string>() + b.get<std::string>();
        }
        if (a.is_array() && b.is_array()) {
            Value result = a;
            for (const auto& item : b) result.push_back(item);
            return result;
        }
        if (a.is_object() && b.is_object()) {
            Value result = a;
            for (auto it = b.begin(); it != b.end(); ++it) result[it.key()] = it.value();
            return result;
        }
        fail(line_, std::string("cannot add ") + a.type_name() + " and " + b.type_name());
    }

    Value compare(const Value& a, const Value& b) const {
        int order;
        if (a.is_number() && b.is_number()) {
            if (both_integers(a, b)) {
                order = to_int(a) < to_int(b) ? -1 : (to_int(a) > to_int(b) ? 1 : 0);
            } else {
                order = to_double(a) < to_double(b) ? -1 : (to_double(a) > to_double(b) ? 1 : 0);
            }
        } else if (a.is_string() && b.is_string()) {
            order = a.get<std::string>().compare(b.get<std::string>());
        } else {
            fail(line_, std::string("cannot compare ") + a.type_name() + " and " + b.type_name());
        }

        switch (op_) {
            case BinaryOp::Lt: return order < 0;
            case BinaryOp::Le: return order <= 0;
            case BinaryOp::Gt: return order > 0;
            default: return order >= 0;
        }
    }

    Value arithmetic(const Value& a, const Value& b) const {
        if (!a.is_number() || !b.is_number()) {
            fail(line_, std::string("arithmetic on ") + a.type_name() + " and " + b.type_name());
        }

        bool integers = both_integers(a, b);
        switch (op_) {
            case BinaryOp::Sub:
                if (integers) return to_int(a) - to_int(b);
                return to_double(a) - to_double(b);
            case BinaryOp::Mul:
                if (integers) return to_int(a) * to_int(b);
                return to_double(a) * to_double(b);
            case BinaryOp::Div:
                if (integers) {
                    if (to_int(b) == 0) fail(line_, "division by zero");
                    if (to_int(a) % to_int(b) == 0) return to_int(a) / to_int(b);
                } else if (to_double(b) == 0.0) {
                    fail(line_, "division by zero");
                }
                return to_double(a) / to_double(b);
            default:
                if (!integers) fail(line_, "modulo requires integers");
                if (to_int(b) == 0) fail(line_, "modulo by zero");
                return to_int(a) % to_int(b);
        }
    }
};

class LogicalExpr : public Expr {
public:
    LogicalExpr(int line, bool is_and, ExprPtr lhs, ExprPtr rhs)
        : Expr(line), is_and_(is_and), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

    Value evaluate(Scope& scope) const override {
        bool left = is_truthy(lhs_->evaluate(scope));
        if (is_and_ && !left) return false;
        if (!is_and_ && left) return true;
        return is_truthy(rhs_->evaluate(scope));
    }

private:
    bool is_and_;
    ExprPtr lhs_;
    ExprPtr rhs_;
};

class ConditionalExpr : public Expr {
public:
    ConditionalExpr(int line, ExprPtr condition, ExprPtr when_true, ExprPtr when_false)
        : Expr(line), condition_(std::move(condition)),
          when_true_(std::move(when_true)), when_false_(std::move(when_false)) {}

    Value evaluate(Scope& scope) const override {
        return is_truthy(condition_->evaluate(scope))
            ? when_true_->evaluate(scope)
            : when_false_->evaluate(scope);
    }

private:
    ExprPtr condition_;
    ExprPtr when_true_;
    ExprPtr when_false_;
};

// ===========================================================================
// Built-in functions
// ===========================================================================

using BuiltinFn = Value (*)(const std::vector<Value>&, int);

struct Builtin {
    size_t min_args;
    size_t max_args;
    BuiltinFn fn;
};

Value fn_len(const std::vector<Value>& args, int line) {
    const Value& v = args[0];
    if (v.is_string()) return static_cast<int64_t>(v.get_ref<const std::string&>().size());
    if (v.is_array() || v.is_object()) return static_cast<int64_t>(v.size());
    fail(line, std::string("len() of ") + v.type_name());
}

Value fn_str(const std::vector<Value>& args, int line) {
    if (args[0].is_string()) return args[0];
    return dump_value(args[0], line);
}

Value fn_int(const std::vector<Value>& args, int line) {
    const Value& v = args[0];
    if (v.is_number_integer()) return to_int(v);
    if (v.is_number_float()) return static_cast<int64_t>(to_double(v));
    if (v.is_boolean()) return static_cast<int64_t>(v.get<bool>() ? 1 : 0);
    if (v.is_string()) {
        const std::string& text = v.get_ref<const std::string&>();
        try {
            size_t consumed = 0;
            int64_t result = std::stoll(text, &consumed);
            if (consumed == text.size()) return result;
        } catch (const std::exception&) {
        }
        fail(line, "int() cannot convert '" + text + "'");
    }
    fail(line, std::string("int() of ") + v.type_name());
}

Value fn_float(const std::vector<Value>& args, int line) {
    const Value& v = args[0];
    if (v.is_number()) return to_double(v);
    if (v.is_string()) {
        const std::string& text = v.get_ref<const std::string&>();
        try {
            size_t consumed = 0;
            double result = std::stod(text, &consumed);
            if (consumed == text.size()) return result;
        } catch (const std::exception&) {
        }
        fail(line, "float() cannot convert '" + text + "'");
    }
    fail(line, std::string("float() of ") + v.type_name());
}

Value change_case(const std::vector<Value>& args, int line, bool upper) {
    if (!args[0].is_string()) {
        fail(line, std::string(upper ? "upper" : "lower") + "() of " + args[0].type_name());
    }
    std::string text = args[0].get<std::string>();
    std::transform(text.begin(), text.end(), text.begin(), [upper](unsigned char c) {
        return static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
    });
    return text;
}

Value fn_lower(const std::vector<Value>& args, int line) { return change_case(args, line, false); }
Value fn_upper(const std::vector<Value>& args, int line) { return change_case(args, line, true); }

Value fn_coalesce(const std::vector<Value>& args, int) {
    for (const auto& v : args) {
        if (!v.is_null()) return v;
    }
    return Value();
}

Value fn_has(const std::vector<Value>& args, int line) {
    const Value& container = args[0];
    const Value& key = args[1];
    if (container.is_null()) return false;
    if (container.is_object() && key.is_string()) return container.contains(key.get<std::string>());
    if (container.is_array() && key.is_number_integer()) {
        return to_int(key) >= 0 && static_cast<size_t>(to_int(key)) < container.size();
    }
    fail(line, std::string("has() of ") + container.type_name() + " with " + key.type_name() + " key");
}

Value fn_keys(const std::vector<Value>& args, int line) {
    if (!args[0].is_object()) fail(line, std::string("keys() of ") + args[0].type_name());
    Value result = Value::array();
    for (auto it = args[0].begin(); it != args[0].end(); ++it) result.push_back(it.key());
    return result;
}

Value fn_contains(const std::vector<Value>& args, int line) {
    const Value& container = args[0];
    const Value& item = args[1];
    if (container.is_string() && item.is_string()) {
        return container.get_ref<const std::string&>().find(item.get_ref<const std::string&>()) !=
               std::string::npos;
    }
    if (container.is_array()) {
        return std::find(container.begin(), container.end(), item) != container.end();
    }
    if (container.is_object() && item.is_string()) {
        return container.contains(item.get<std::string>());
    }
    fail(line, std::string("contains() of ") + container.type_name() + " and " + item.type_name());
}

Value fn_json_parse(const std::vector<Value>& args, int line) {
    if (!args[0].is_string()) fail(line, std::string("json_parse() of ") + args[0].type_name());
    try {
        return Value::parse(args[0].get<std::string>());
    } catch (const nlohmann::json::parse_error& e) {
        fail(line, std::string("json_parse(): ") + e.what());
    }
}

Value fn_json_dump(const std::vector<Value>& args, int line) {
    return dump_value(args[0], line);
}

const std::map<std::string, Builtin>& builtins() {
    static const std::map<std::string, Builtin> table = {
        {"len", {1, 1, fn_len}},
        {"str", {1, 1, fn_str}},
        {"int", {1, 1, fn_int}},
        {"float", {1, 1, fn_float}},
        {"lower", {1, 1, fn_lower}},
        {"upper", {1, 1, fn_upper}},
        {"coalesce", {1, std::numeric_limits<size_t>::max(), fn_coalesce}},
        {"has", {2, 2, fn_has}},
        {"keys", {1, 1, fn_keys}},
        {"contains", {2, 2, fn_contains}},
        {"json_parse", {1, 1, fn_json_parse}},
        {"json_dump", {1, 1, fn_json_dump}},
    };
    return table;
}

class CallExpr : public Expr {
public:
    CallExpr(int line, const Builtin& builtin, std::vector<ExprPtr> args)
        : Expr(line), builtin_(builtin), args_(std::move(args)) {}

    Value evaluate(Scope& scope) const override {
        std::vector<Value> values;
        values.reserve(args_.size());
        for (const auto& arg : args_) {
            values.push_back(arg->evaluate(scope));
        }
        return builtin_.fn(values, line_);
    }

private:
    const Builtin& builtin_;
    std::vector<ExprPtr> args_;
};

// ===========================================================================
// Statements
// ===========================================================================

class Statement {
public:
    virtual ~Statement() = default;
    virtual void execute(Scope& scope) const = 0;
};

using Block = std::vector<std::unique_ptr<Statement>>;

void execute_block(const Block& block, Scope& scope) {
    for (const auto& statement : block) {
        statement->execute(scope);
    }
}

class AssignStatement : public Statement {
public:
    AssignStatement(std::unique_ptr<PathExpr> target, ExprPtr value)
        : target_(std::move(target)), value_(std::move(value)) {}

    void execute(Scope& scope) const override {
        Value value = value_->evaluate(scope);
        target_->assign(scope, std::move(value));
    }

private:
    std::unique_ptr<PathExpr> target_;
    ExprPtr value_;
};

class DeleteStatement : public Statement {
public:
    explicit DeleteStatement(std::unique_ptr<PathExpr> target) : target_(std::move(target)) {}

    void execute(Scope& scope) const override { target_->erase(scope); }

private:
    std::unique_ptr<PathExpr> target_;
};

class IfStatement : public Statement {
public:
    IfStatement(ExprPtr condition, Block then_block, Block else_block)
        : condition_(std::move(condition)),
          then_block_(std::move(then_block)), else_block_(std::move(else_block)) {}

    void execute(Scope& scope) const override {
        if (is_truthy(condition_->evaluate(scope))) {
            execute_block(then_block_, scope);
        } else {
            execute_block(else_block_, scope);
        }
    }

private:
    ExprPtr condition_;
    Block then_block_;
    Block else_block_;
};

// ===========================================================================
// Parser
// ===========================================================================

constexpr int MAX_NESTING_DEPTH = 64;

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    Block parse_program() {
        Block block = parse_statements();
        if (peek().kind != TokenKind::End) {
            error("unexpected '" + peek().text + "'");
        }
        return block;
    }

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    int depth_ = 0;

    struct DepthGuard {
        Parser& parser;
        explicit DepthGuard(Parser& p) : parser(p) {
            if (++parser.depth_ > MAX_NESTING_DEPTH) {
                parser.error("nesting too deep");
            }
        }
        ~DepthGuard() { --parser.depth_; }
    };

    const Token& peek() const { return tokens_[pos_]; }
    const Token& advance() { return tokens_[pos_ < tokens_.size() - 1 ? pos_++ : pos_]; }

    [[noreturn]] void error(const std::string& message) const {
        throw ScriptSyntaxError(peek().line, message);
    }

    bool check_op(const char* op) const {
        return peek().kind == TokenKind::Operator && peek().text == op;
    }

    bool match_op(const char* op) {
        if (check_op(op)) {
            advance();
            return true;
        }
        return false;
    }

    void expect_op(const char* op) {
        if (!match_op(op)) {
            error(std::string("expected '") + op + "' but found '" +
                  (peek().kind == TokenKind::Newline ? "newline" : peek().text) + "'");
        }
    }

    bool check_keyword(const char* keyword) const {
        return peek().kind == TokenKind::Identifier && peek().text == keyword;
    }

    bool is_separator() const {
        return peek().kind == TokenKind::Newline || check_op(";");
    }

    void skip_separators() {
        while (is_separator()) advance();
    }

    void skip_newlines() {
        while (peek().kind == TokenKind::Newline) advance();
    }

    Block parse_statements() {
        Block block;
        skip_separators();
        while (peek().kind != TokenKind::End && !check_op("}")) {
            block.push_back(parse_statement());
            if (!is_separator() && peek().kind != TokenKind::End && !check_op("}")) {
                error("expected end of statement but found '" + peek().text + "'");
            }
            skip_separators();
        }
        return block;
    }

    Block parse_braced_block() {
        DepthGuard guard(*this);
        expect_op("{");
        Block block = parse_statements();
        expect_op("}");
        return block;
    }

    std::unique_ptr<Statement> parse_statement() {
        if (check_keyword("if")) {
            return parse_if();
        }
        if (check_keyword("del")) {
            advance();
            auto target = parse_target();
            return std::make_unique<DeleteStatement>(std::move(target));
        }
        if (peek().kind == TokenKind::Identifier) {
            auto target = parse_target();
            expect_op("=");
            ExprPtr value = parse_expression();
            return std::make_unique<AssignStatement>(std::move(target), std::move(value));
        }
        error("expected a statement but found '" + peek().text + "'");
    }

    std::unique_ptr<Statement> parse_if() {
        DepthGuard guard(*this);
        advance();  // 'if'
        ExprPtr condition = parse_expression();
        Block then_block = parse_braced_block();
        Block else_block;

        size_t saved = pos_;
        skip_newlines();
        if (check_keyword("else")) {
            advance();
            if (check_keyword("if")) {
                else_block.push_back(parse_if());
            } else {
                else_block = parse_braced_block();
            }
        } else {
            pos_ = saved;
        }

        return std::make_unique<IfStatement>(std::move(condition), std::move(then_block), std::move(else_block));
    }

    std::unique_ptr<PathExpr> parse_target() {
        if (peek().kind != TokenKind::Identifier ||
            (peek().text != "data" && peek().text != "state" && peek().text != "config")) {
            error("assignment target must start with 'data' or 'state'");
        }
        if (peek().text == "config") {
            error("config is read-only");
        }
        return parse_path();
    }

    std::unique_ptr<PathExpr> parse_path() {
        const Token& root_token = advance();
        Root root = root_token.text == "data" ? Root::Data
                  : root_token.text == "state" ? Root::State : Root::Config;

        std::vector<PathSegment> segments;
        while (true) {
            if (match_op(".")) {
                if (peek().kind != TokenKind::Identifier) {
                    error("expected a field name after '.'");
                }
                segments.push_back({advance().text, nullptr});
            } else if (check_op("[")) {
                DepthGuard guard(*this);
                advance();
                ExprPtr index = parse_expression();
                expect_op("]");
                segments.push_back({"", std::move(index)});
            } else {
                break;
            }
        }
        return std::make_unique<PathExpr>(root_token.line, root, std::move(segments));
    }

    ExprPtr parse_expression() {
        DepthGuard guard(*this);
        return parse_conditional();
    }

    ExprPtr parse_conditional() {
        int line = peek().line;
        ExprPtr condition = parse_or();
        if (match_op("?")) {
            ExprPtr when_true = parse_expression();
            expect_op(":");
            ExprPtr when_false = parse_expression();
            return std::make_unique<ConditionalExpr>(line, std::move(condition),
                                                     std::move(when_true), std::move(when_false));
        }
        return condition;
    }

    ExprPtr parse_or() {
        ExprPtr lhs = parse_and();
        while (check_op("||")) {
            int line = advance().line;
            lhs = std::make_unique<LogicalExpr>(line, false, std::move(lhs), parse_and());
        }
        return lhs;
    }

    ExprPtr parse_and() {
        ExprPtr lhs = parse_equality();
        while (check_op("&&")) {
            int line = advance().line;
            lhs = std::make_unique<LogicalExpr>(line, true, std::move(lhs), parse_equality());
        }
        return lhs;
    }

    ExprPtr parse_equality() {
        ExprPtr lhs = parse_comparison();
        while (check_op("==") || check_op("!=")) {
            const Token& op = advance();
            BinaryOp kind = op.text == "==" ? BinaryOp::Eq : BinaryOp::Ne;
            lhs = std::make_unique<BinaryExpr>(op.line, kind, std::move(lhs), parse_comparison());
        }
        return lhs;
    }

    ExprPtr parse_comparison() {
        ExprPtr lhs = parse_additive();
        while (check_op("<") || check_op("<=") || check_op(">") || check_op(">=")) {
            const Token& op = advance();
            BinaryOp kind = op.text == "<" ? BinaryOp::Lt
                          : op.text == "<=" ? BinaryOp::Le
                          : op.text == ">" ? BinaryOp::Gt : BinaryOp::Ge;
            lhs = std::make_unique<BinaryExpr>(op.line, kind, std::move(lhs), parse_additive());
        }
        return lhs;
    }

    ExprPtr parse_additive() {
        ExprPtr lhs = parse_multiplicative();
        while (check_op("+") || check_op("-")) {
            const Token& op = advance();
            BinaryOp kind = op.text == "+" ? BinaryOp::Add : BinaryOp::Sub;
            lhs = std::make_unique<BinaryExpr>(op.line, kind, std::move(lhs), parse_multiplicative());
        }
        return lhs;
    }

    ExprPtr parse_multiplicative() {
        ExprPtr lhs = parse_unary();
        while (check_op("*") || check_op("/") || check_op("%")) {
            const Token& op = advance();
            BinaryOp kind = op.text == "*" ? BinaryOp::Mul
                          : op.text == "/" ? BinaryOp::Div : BinaryOp::Mod;
            lhs = std::make_unique<BinaryExpr>(op.line, kind, std::move(lhs), parse_unary());
        }
        return lhs;
    }

    ExprPtr parse_unary() {
        if (check_op("!") || check_op("-")) {
            DepthGuard guard(*this);
            const Token& op = advance();
            UnaryOp kind = op.text == "!" ? UnaryOp::Not : UnaryOp::Negate;
            return std::make_unique<UnaryExpr>(op.line, kind, parse_unary());
        }
        return parse_primary();
    }

    ExprPtr parse_primary() {
        const Token& token = peek();

        switch (token.kind) {
            case TokenKind::Number:
                advance();
                return std::make_unique<LiteralExpr>(token.line, token.number);
            case TokenKind::String:
                advance();
                return std::make_unique<LiteralExpr>(token.line, Value(token.text));
            case TokenKind::Identifier:
                return parse_identifier();
            case TokenKind::Operator:
                if (token.text == "(") {
                    advance();
                    ExprPtr inner = parse_expression();
                    expect_op(")");
                    return inner;
                }
                if (token.text == "[") return parse_array();
                if (token.text == "{") return parse_object();
                break;
            default:
                break;
        }
        error("expected an expression but found '" +
              (token.kind == TokenKind::Newline ? std::string("newline")
               : token.kind == TokenKind::End ? std::string("end of script") : token.text) + "'");
    }

    ExprPtr parse_identifier() {
        const Token& token = peek();
        const std::string& name = token.text;

        if (name == "true" || name == "false") {
            advance();
            return std::make_unique<LiteralExpr>(token.line, Value(name == "true"));
        }
        if (name == "null") {
            advance();
            return std::make_unique<LiteralExpr>(token.line, Value());
        }
        if (name == "data" || name == "state" || name == "config") {
            return parse_path();
        }

        int line = token.line;
        advance();
        if (!check_op("(")) {
            throw ScriptSyntaxError(line, "unknown identifier '" + name + "'");
        }

        auto it = builtins().find(name);
        if (it == builtins().end()) {
            throw ScriptSyntaxError(line, "unknown function '" + name + "'");
        }

        DepthGuard guard(*this);
        advance();  // '('
        std::vector<ExprPtr> args;
        if (!check_op(")")) {
            do {
                args.push_back(parse_expression());
            } while (match_op(","));
        }
        expect_op(")");

        const Builtin& builtin = it->second;
        if (args.size() < builtin.min_args || args.size() > builtin.max_args) {
            throw ScriptSyntaxError(line, "wrong number of arguments to " + name + "()");
        }
        return std::make_unique<CallExpr>(line, builtin, std::move(args));
    }

    ExprPtr parse_array() {
        DepthGuard guard(*this);
        int line = advance().line;  // '['
        std::vector<ExprPtr> items;
        if (!check_op("]")) {
            do {
                if (check_op("]")) break;  // trailing comma
                items.push_back(parse_expression());
            } while (match_op(","));
        }
        expect_op("]");
        return std::make_unique<ArrayExpr>(line, std::move(items));
    }

    ExprPtr parse_object() {
        DepthGuard guard(*this);
        int line = advance().line;  // '{'
        std::vector<std::pair<std::string, ExprPtr>> members;
        skip_newlines();
        if (!check_op("}")) {
            do {
                skip_newlines();
                if (check_op("}")) break;  // trailing comma
                if (peek().kind != TokenKind::String && peek().kind != TokenKind::Identifier) {
                    error("expected an object key");
                }
                std::string key = advance().text;
                expect_op(":");
                skip_newlines();
                members.emplace_back(key, parse_expression());
                skip_newlines();
            } while (match_op(","));
        }
        skip_newlines();
        expect_op("}");
        return std::make_unique<ObjectExpr>(line, std::move(members));
    }
};

} // namespace

struct Program {
    Block statements;
};

// ===========================================================================
// Script
// ===========================================================================

Script::Script(std::shared_ptr<const Program> program)
    : program_(std::move(program)) {}

Script Script::compile(const std::string& source) {
    Parser parser(tokenize(source));
    auto program = std::make_shared<Program>();
    program->statements = parser.parse_program();
    return Script(std::move(program));
}

void Script::run(Value& data, Value& state, const Value& config) const {
    Scope scope{data, state, config};
    execute_block(program_->statements, scope);
}

size_t Script::size() const {
    return program_->statements.size();
}

std::vector<std::string> builtin_function_names() {
    std::vector<std::string> names;
    for (const auto& pair : builtins()) {
        names.push_back(pair.first);
    }
    return names;
}

} // namespace script
} // namespace flowapi
