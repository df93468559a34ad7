// modules/expr/expression.h
#ifndef AGENTFLOW_MODULES_EXPR_EXPRESSION_H
#define AGENTFLOW_MODULES_EXPR_EXPRESSION_H

#include "core/types/context.h" // 引入 Value
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

// Variable path as written after `$`: "$ctx.items[0].name" -> {"ctx", "items", "0", "name"}
using VariablePath = std::vector<std::string>;

// Supplies values for `$path` references. Missing paths return null.
class VariableLookup {
public:
    virtual ~VariableLookup() = default;
    virtual Value lookup(const VariablePath& path) const = 0;
};

namespace detail {
struct AstNode;
}

// A parsed expression. Grammar (lowest precedence first):
//   ternary  := or ('?' ternary ':' ternary)?
//   or       := and (('||' | 'or') and)*
//   and      := equality (('&&' | 'and') equality)*
//   equality := compare (('==' | '!=') compare)*
//   compare  := additive (('<' | '<=' | '>' | '>=') additive)*
//   additive := mult (('+' | '-') mult)*
//   mult     := unary (('*' | '/' | '%') unary)*
//   unary    := ('!' | 'not' | '-') unary | postfix
//   postfix  := primary ('.' ident | '[' ternary ']')*
//   primary  := number | string | true | false | null | $path | ident '(' args ')'
//             | '(' ternary ')' | '[' items ']' | '{' key ':' value, ... '}'
class Expression {
public:
    // throws FlowError(EVAL_ERROR) on a syntax error
    static Expression parse(const std::string& source);

    // Like parse but returns nullopt instead of throwing
    static std::optional<Expression> try_parse(const std::string& source);

    Value evaluate(const VariableLookup& vars) const;

    const std::string& source() const { return source_; }

    // Every `$path` referenced, in source order
    std::vector<VariablePath> variables() const;

private:
    Expression(std::string source, std::shared_ptr<const detail::AstNode> root)
        : source_(std::move(source)), root_(std::move(root)) {}

    std::string source_;
    std::shared_ptr<const detail::AstNode> root_;
};

// Convenience wrappers
Value evaluate_expression(const std::string& source, const VariableLookup& vars);
bool evaluate_condition(const std::string& source, const VariableLookup& vars);

// Receives the first segment of every `$path`; returns the replacement for that
// segment or nullopt to keep it.
using FirstSegmentRewriter = std::function<std::optional<std::string>(const std::string&)>;

// Rewrites variable references in `source` without touching string literals.
// Text that is not a valid expression is returned unchanged.
std::string rewrite_variable_roots(const std::string& source, const FirstSegmentRewriter& rewriter);

// Built-in function table used by call expressions
Value call_expression_function(const std::string& name, const std::vector<Value>& args);
bool has_expression_function(const std::string& name);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_EXPR_EXPRESSION_H
