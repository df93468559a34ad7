// modules/expr/expression.cpp
#include "expr/expression.h"
#include "core/types/errors.h"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace agentflow {

namespace detail {

enum class AstType : uint8_t {
    LITERAL,
    VARIABLE,
    UNARY,
    BINARY,
    TERNARY,
    CALL,
    INDEX,
    ARRAY,
    OBJECT
};

struct AstNode {
    AstType type;
    Value literal;                 // LITERAL
    VariablePath path;             // VARIABLE
    std::string op;                // UNARY / BINARY operator, CALL function name
    std::vector<std::string> keys; // OBJECT keys, parallel to children
    std::vector<std::shared_ptr<const AstNode>> children;
};

} // namespace detail

using detail::AstNode;
using detail::AstType;
using AstPtr = std::shared_ptr<const AstNode>;

namespace {

// ————————————————————————
// Lexer
// ————————————————————————

enum class TokenType : uint8_t {
    NUMBER,
    STRING,
    IDENT,
    VARIABLE,
    OP,
    LPAREN,
    RPAREN,
    LBRACKET,
    RBRACKET,
    LBRACE,
    RBRACE,
    COMMA,
    COLON,
    QUESTION,
    DOT,
    END
};

struct Token {
    TokenType type;
    std::string text;
    Value literal;
    VariablePath path;
    size_t pos = 0;       // offset of the first character
    size_t root_end = 0;  // VARIABLE: offset one past the first path segment
};

[[noreturn]] void syntax_error(const std::string& source, size_t pos, const std::string& what) {
    throw FlowError(ErrorCode::EVAL_ERROR,
                    "Syntax error at " + std::to_string(pos) + " in '" + source + "': " + what);
}

bool ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

class Lexer {
public:
    explicit Lexer(const std::string& src) : src_(src) {}

    std::vector<Token> tokenize() {
        std::vector<Token> tokens;
        while (true) {
            skip_space();
            if (i_ >= src_.size()) {
                tokens.push_back(Token{TokenType::END, "", nullptr, {}, i_, i_});
                return tokens;
            }
            tokens.push_back(next());
        }
    }

private:
    const std::string& src_;
    size_t i_ = 0;

    void skip_space() {
        while (i_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[i_]))) ++i_;
    }

    char peek(size_t ahead = 0) const {
        return i_ + ahead < src_.size() ? src_[i_ + ahead] : '\0';
    }

    Token simple(TokenType type, size_t len) {
        Token t{type, src_.substr(i_, len), nullptr, {}, i_, 0};
        i_ += len;
        return t;
    }

    Token next() {
        char c = peek();
        if (c == '$') return variable();
        if (std::isdigit(static_cast<unsigned char>(c))) return number();
        if (c == '"' || c == '\'') return string_literal(c);
        if (ident_start(c)) {
            size_t start = i_;
            while (ident_char(peek())) ++i_;
            return Token{TokenType::IDENT, src_.substr(start, i_ - start), nullptr, {}, start, 0};
        }

        std::string two = src_.substr(i_, 2);
        if (two == "==" || two == "!=" || two == "<=" || two == ">=" || two == "&&" || two == "||") {
            return simple(TokenType::OP, 2);
        }
        switch (c) {
            case '<': case '>': case '+': case '-': case '*': case '/': case '%': case '!':
                return simple(TokenType::OP, 1);
            case '(': return simple(TokenType::LPAREN, 1);
            case ')': return simple(TokenType::RPAREN, 1);
            case '[': return simple(TokenType::LBRACKET, 1);
            case ']': return simple(TokenType::RBRACKET, 1);
            case '{': return simple(TokenType::LBRACE, 1);
            case '}': return simple(TokenType::RBRACE, 1);
            case ',': return simple(TokenType::COMMA, 1);
            case ':': return simple(TokenType::COLON, 1);
            case '?': return simple(TokenType::QUESTION, 1);
            case '.': return simple(TokenType::DOT, 1);
            default: break;
        }
        syntax_error(src_, i_, std::string("unexpected character '") + c + "'");
    }

    Token variable() {
        Token t{TokenType::VARIABLE, "", nullptr, {}, i_, 0};
        ++i_; // '$'
        if (!ident_start(peek())) syntax_error(src_, i_, "expected a name after '$'");
        size_t start = i_;
        while (ident_char(peek())) ++i_;
        t.path.push_back(src_.substr(start, i_ - start));
        t.root_end = i_;

        while (true) {
            if (peek() == '.' && (ident_char(peek(1)))) {
                ++i_;
                size_t seg = i_;
                while (ident_char(peek())) ++i_;
                t.path.push_back(src_.substr(seg, i_ - seg));
            } else if (peek() == '[' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
                size_t j = i_ + 1;
                while (j < src_.size() && std::isdigit(static_cast<unsigned char>(src_[j]))) ++j;
                if (j >= src_.size() || src_[j] != ']') break; // dynamic index, left to the parser
                t.path.push_back(src_.substr(i_ + 1, j - i_ - 1));
                i_ = j + 1;
            } else {
                break;
            }
        }
        t.text = src_.substr(t.pos, i_ - t.pos);
        return t;
    }

    Token number() {
        size_t start = i_;
        while (std::isdigit(static_cast<unsigned char>(peek()))) ++i_;
        bool is_float = false;
        if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
            is_float = true;
            ++i_;
            while (std::isdigit(static_cast<unsigned char>(peek()))) ++i_;
        }
        if (peek() == 'e' || peek() == 'E') {
            size_t save = i_;
            ++i_;
            if (peek() == '+' || peek() == '-') ++i_;
            if (std::isdigit(static_cast<unsigned char>(peek()))) {
                is_float = true;
                while (std::isdigit(static_cast<unsigned char>(peek()))) ++i_;
            } else {
                i_ = save;
            }
        }
        if (ident_start(peek())) syntax_error(src_, i_, "malformed number");
        std::string text = src_.substr(start, i_ - start);
        Token t{TokenType::NUMBER, text, nullptr, {}, start, 0};
        if (is_float) {
            t.literal = std::strtod(text.c_str(), nullptr);
        } else {
            try {
                t.literal = std::stoll(text);
            } catch (const std::out_of_range&) {
                t.literal = std::strtod(text.c_str(), nullptr);
            }
        }
        return t;
    }

    Token string_literal(char quote) {
        size_t start = i_;
        ++i_;
        std::string out;
        while (true) {
            if (i_ >= src_.size()) syntax_error(src_, start, "unterminated string");
            char c = src_[i_++];
            if (c == quote) break;
            if (c == '\\' && i_ < src_.size()) {
                char e = src_[i_++];
                switch (e) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    case 'r': out += '\r'; break;
                    default: out += e; break;
                }
                continue;
            }
            out += c;
        }
        return Token{TokenType::STRING, src_.substr(start, i_ - start), out, {}, start, 0};
    }
};

// ————————————————————————
// Parser
// ————————————————————————

std::shared_ptr<AstNode> make_node(AstType type) {
    auto n = std::make_shared<AstNode>();
    n->type = type;
    return n;
}

class Parser {
public:
    Parser(const std::string& src, std::vector<Token> tokens) : src_(src), tokens_(std::move(tokens)) {}

    AstPtr parse() {
        auto root = ternary();
        if (cur().type != TokenType::END) syntax_error(src_, cur().pos, "unexpected '" + cur().text + "'");
        return root;
    }

private:
    const std::string& src_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;

    const Token& cur() const { return tokens_[pos_]; }
    const Token& advance() { return tokens_[pos_++]; }

    bool is_op(const char* op) const { return cur().type == TokenType::OP && cur().text == op; }
    bool is_word(const char* word) const { return cur().type == TokenType::IDENT && cur().text == word; }

    void expect(TokenType type, const char* what) {
        if (cur().type != type) syntax_error(src_, cur().pos, std::string("expected ") + what);
        ++pos_;
    }

    AstPtr binary(std::string op, AstPtr lhs, AstPtr rhs) {
        auto n = make_node(AstType::BINARY);
        n->op = std::move(op);
        n->children = {std::move(lhs), std::move(rhs)};
        return n;
    }

    AstPtr ternary() {
        auto cond = logical_or();
        if (cur().type != TokenType::QUESTION) return cond;
        ++pos_;
        auto yes = ternary();
        expect(TokenType::COLON, "':' in conditional expression");
        auto no = ternary();
        auto n = make_node(AstType::TERNARY);
        n->children = {cond, yes, no};
        return n;
    }

    AstPtr logical_or() {
        auto lhs = logical_and();
        while (is_op("||") || is_word("or")) {
            ++pos_;
            lhs = binary("||", lhs, logical_and());
        }
        return lhs;
    }

    AstPtr logical_and() {
        auto lhs = equality();
        while (is_op("&&") || is_word("and")) {
            ++pos_;
            lhs = binary("&&", lhs, equality());
        }
        return lhs;
    }

    AstPtr equality() {
        auto lhs = comparison();
        while (is_op("==") || is_op("!=")) {
            std::string op = advance().text;
            lhs = binary(op, lhs, comparison());
        }
        return lhs;
    }

    AstPtr comparison() {
        auto lhs = additive();
        while (is_op("<") || is_op("<=") || is_op(">") || is_op(">=")) {
            std::string op = advance().text;
            lhs = binary(op, lhs, additive());
        }
        return lhs;
    }

    AstPtr additive() {
        auto lhs = multiplicative();
        while (is_op("+") || is_op("-")) {
            std::string op = advance().text;
            lhs = binary(op, lhs, multiplicative());
        }
        return lhs;
    }

    AstPtr multiplicative() {
        auto lhs = unary();
        while (is_op("*") || is_op("/") || is_op("%")) {
            std::string op = advance().text;
            lhs = binary(op, lhs, unary());
        }
        return lhs;
    }

    AstPtr unary() {
        if (is_op("!") || is_word("not") || is_op("-")) {
            std::string op = advance().text == "-" ? "-" : "!";
            auto n = make_node(AstType::UNARY);
            n->op = op;
            n->children = {unary()};
            return n;
        }
        return postfix();
    }

    AstPtr postfix() {
        auto node = primary();
        while (true) {
            if (cur().type == TokenType::DOT) {
                ++pos_;
                if (cur().type != TokenType::IDENT) syntax_error(src_, cur().pos, "expected a field name after '.'");
                auto key = make_node(AstType::LITERAL);
                key->literal = advance().text;
                auto n = make_node(AstType::INDEX);
                n->children = {node, key};
                node = n;
            } else if (cur().type == TokenType::LBRACKET) {
                ++pos_;
                auto index = ternary();
                expect(TokenType::RBRACKET, "']'");
                auto n = make_node(AstType::INDEX);
                n->children = {node, index};
                node = n;
            } else {
                return node;
            }
        }
    }

    AstPtr primary() {
        const Token& t = cur();
        switch (t.type) {
            case TokenType::NUMBER:
            case TokenType::STRING: {
                auto n = make_node(AstType::LITERAL);
                n->literal = advance().literal;
                return n;
            }
            case TokenType::VARIABLE: {
                auto n = make_node(AstType::VARIABLE);
                n->path = advance().path;
                return n;
            }
            case TokenType::IDENT:
                return identifier();
            case TokenType::LPAREN: {
                ++pos_;
                auto inner = ternary();
                expect(TokenType::RPAREN, "')'");
                return inner;
            }
            case TokenType::LBRACKET:
                return array_literal();
            case TokenType::LBRACE:
                return object_literal();
            default:
                break;
        }
        syntax_error(src_, t.pos, t.type == TokenType::END ? "unexpected end of expression"
                                                         : "unexpected '" + t.text + "'");
    }

    AstPtr identifier() {
        const Token& t = advance();
        if (t.text == "true" || t.text == "false" || t.text == "null") {
            auto n = make_node(AstType::LITERAL);
            n->literal = t.text == "null" ? Value(nullptr) : Value(t.text == "true");
            return n;
        }
        // bare words are not expressions; callers fall back to literal text
        if (cur().type != TokenType::LPAREN) syntax_error(src_, t.pos, "unknown identifier '" + t.text + "'");
        ++pos_;
        auto n = make_node(AstType::CALL);
        n->op = t.text;
        if (cur().type != TokenType::RPAREN) {
            while (true) {
                n->children.push_back(ternary());
                if (cur().type != TokenType::COMMA) break;
                ++pos_;
            }
        }
        expect(TokenType::RPAREN, "')' after arguments");
        return n;
    }

    AstPtr array_literal() {
        ++pos_;
        auto n = make_node(AstType::ARRAY);
        if (cur().type != TokenType::RBRACKET) {
            while (true) {
                n->children.push_back(ternary());
                if (cur().type != TokenType::COMMA) break;
                ++pos_;
            }
        }
        expect(TokenType::RBRACKET, "']'");
        return n;
    }

    AstPtr object_literal() {
        ++pos_;
        auto n = make_node(AstType::OBJECT);
        if (cur().type != TokenType::RBRACE) {
            while (true) {
                const Token& key = cur();
                if (key.type == TokenType::STRING) {
                    n->keys.push_back(key.literal.get<std::string>());
                } else if (key.type == TokenType::IDENT) {
                    n->keys.push_back(key.text);
                } else {
                    syntax_error(src_, key.pos, "expected an object key");
                }
                ++pos_;
                expect(TokenType::COLON, "':' after object key");
                n->children.push_back(ternary());
                if (cur().type != TokenType::COMMA) break;
                ++pos_;
            }
        }
        expect(TokenType::RBRACE, "'}'");
        return n;
    }
};

// ————————————————————————
// Evaluation
// ————————————————————————

int64_t index_from(const Value& key) {
    if (key.is_number_unsigned() && key.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
        throw FlowError(ErrorCode::EVAL_ERROR, "Index out of range: " + key.dump());
    }
    if (key.is_number_integer()) return key.get<int64_t>();
    double d = key.get<double>();
    // 超出 int64 的下标直接报错，避免未定义的转换
    if (!std::isfinite(d) || d >= 9.2e18 || d <= -9.2e18) {
        throw FlowError(ErrorCode::EVAL_ERROR, "Index out of range: " + key.dump());
    }
    return static_cast<int64_t>(d);
}

Value index_value(const Value& target, const Value& key) {
    if (target.is_object()) {
        if (!key.is_string()) return nullptr;
        auto it = target.find(key.get<std::string>());
        return it == target.end() ? Value(nullptr) : *it;
    }
    if (target.is_array()) {
        if (!key.is_number()) return nullptr;
        auto idx = index_from(key);
        if (idx < 0) idx += static_cast<int64_t>(target.size());
        if (idx < 0 || idx >= static_cast<int64_t>(target.size())) return nullptr;
        return target[static_cast<size_t>(idx)];
    }
    if (target.is_string() && key.is_number()) {
        const auto& s = target.get_ref<const std::string&>();
        auto idx = index_from(key);
        if (idx < 0 || idx >= static_cast<int64_t>(s.size())) return nullptr;
        return std::string(1, s[static_cast<size_t>(idx)]);
    }
    return nullptr;
}

int compare_values(const Value& a, const Value& b, const std::string& op) {
    if (a.is_number() && b.is_number()) {
        double x = a.get<double>(), y = b.get<double>();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_string() && b.is_string()) {
        return a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
    }
    throw FlowError(ErrorCode::EVAL_ERROR, "Cannot compare " + value::type_name(a) + " " + op + " " +
                                           value::type_name(b));
}

Value apply_binary(const std::string& op, const Value& a, const Value& b) {
    if (op == "==") return a == b;
    if (op == "!=") return a != b;
    if (op == "<") return compare_values(a, b, op) < 0;
    if (op == "<=") return compare_values(a, b, op) <= 0;
    if (op == ">") return compare_values(a, b, op) > 0;
    if (op == ">=") return compare_values(a, b, op) >= 0;

    if (op == "+") {
        if (a.is_string() || b.is_string()) return value::to_display(a) + value::to_display(b);
        if (a.is_array() && b.is_array()) {
            Value out = a;
            for (const auto& item : b) out.push_back(item);
            return out;
        }
        if (a.is_object() && b.is_object()) {
            Value out = a;
            out.update(b);
            return out;
        }
        return value::from_number(value::to_number(a) + value::to_number(b));
    }

    double x = value::to_number(a);
    double y = value::to_number(b);
    if (op == "-") return value::from_number(x - y);
    if (op == "*") return value::from_number(x * y);
    if (op == "/") {
        if (y == 0.0) throw FlowError(ErrorCode::EVAL_ERROR, "Division by zero");
        return value::from_number(x / y);
    }
    if (op == "%") {
        if (y == 0.0) throw FlowError(ErrorCode::EVAL_ERROR, "Modulo by zero");
        return value::from_number(std::fmod(x, y));
    }
    throw FlowError(ErrorCode::EVAL_ERROR, "Unknown operator " + op);
}

Value eval_node(const AstNode& node, const VariableLookup& vars) {
    switch (node.type) {
        case AstType::LITERAL:
            return node.literal;
        case AstType::VARIABLE:
            return vars.lookup(node.path);
        case AstType::UNARY: {
            Value v = eval_node(*node.children[0], vars);
            if (node.op == "!") return !value::truthy(v);
            return value::from_number(-value::to_number(v));
        }
        case AstType::BINARY: {
            // 短路求值
            if (node.op == "&&") {
                if (!value::truthy(eval_node(*node.children[0], vars))) return false;
                return value::truthy(eval_node(*node.children[1], vars));
            }
            if (node.op == "||") {
                if (value::truthy(eval_node(*node.children[0], vars))) return true;
                return value::truthy(eval_node(*node.children[1], vars));
            }
            return apply_binary(node.op, eval_node(*node.children[0], vars), eval_node(*node.children[1], vars));
        }
        case AstType::TERNARY:
            return value::truthy(eval_node(*node.children[0], vars)) ? eval_node(*node.children[1], vars)
                                                                     : eval_node(*node.children[2], vars);
        case AstType::CALL: {
            std::vector<Value> args;
            args.reserve(node.children.size());
            for (const auto& c : node.children) args.push_back(eval_node(*c, vars));
            return call_expression_function(node.op, args);
        }
        case AstType::INDEX:
            return index_value(eval_node(*node.children[0], vars), eval_node(*node.children[1], vars));
        case AstType::ARRAY: {
            Value arr = Value::array();
            for (const auto& c : node.children) arr.push_back(eval_node(*c, vars));
            return arr;
        }
        case AstType::OBJECT: {
            Value obj = Value::object();
            for (size_t i = 0; i < node.keys.size(); ++i) obj[node.keys[i]] = eval_node(*node.children[i], vars);
            return obj;
        }
    }
    return nullptr;
}

void collect_variables(const AstNode& node, std::vector<VariablePath>& out) {
    if (node.type == AstType::VARIABLE) out.push_back(node.path);
    for (const auto& c : node.children) collect_variables(*c, out);
}

} // namespace

Expression Expression::parse(const std::string& source) {
    Lexer lexer(source);
    Parser parser(source, lexer.tokenize());
    return Expression(source, parser.parse());
}

std::optional<Expression> Expression::try_parse(const std::string& source) {
    try {
        return parse(source);
    } catch (const FlowError&) {
        return std::nullopt;
    }
}

Value Expression::evaluate(const VariableLookup& vars) const {
    return eval_node(*root_, vars);
}

std::vector<VariablePath> Expression::variables() const {
    std::vector<VariablePath> out;
    collect_variables(*root_, out);
    return out;
}

Value evaluate_expression(const std::string& source, const VariableLookup& vars) {
    return Expression::parse(source).evaluate(vars);
}

bool evaluate_condition(const std::string& source, const VariableLookup& vars) {
    return value::truthy(evaluate_expression(source, vars));
}

std::string rewrite_variable_roots(const std::string& source, const FirstSegmentRewriter& rewriter) {
    std::vector<Token> tokens;
    try {
        tokens = Lexer(source).tokenize();
        Parser(source, tokens).parse();
    } catch (const FlowError&) {
        // not an expression (free text with $refs inside): rewrite lexically
        std::string out;
        size_t copied = 0;
        for (size_t i = 0; i + 1 < source.size(); ++i) {
            if (source[i] != '$' || !ident_start(source[i + 1])) continue;
            size_t end = i + 1;
            while (end < source.size() && ident_char(source[end])) ++end;
            auto replacement = rewriter(source.substr(i + 1, end - i - 1));
            if (replacement) {
                out.append(source, copied, i + 1 - copied);
                out += *replacement;
                copied = end;
            }
            i = end - 1;
        }
        out.append(source, copied, std::string::npos);
        return out;
    }

    std::string out;
    size_t copied = 0;
    for (const auto& t : tokens) {
        if (t.type != TokenType::VARIABLE) continue;
        auto replacement = rewriter(t.path.front());
        if (!replacement) continue;
        out.append(source, copied, t.pos + 1 - copied); // up to and including '$'
        out += *replacement;
        copied = t.root_end;
    }
    out.append(source, copied, std::string::npos);
    return out;
}

} // namespace agentflow
