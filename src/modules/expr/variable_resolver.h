// modules/expr/variable_resolver.h
#ifndef AGENTFLOW_MODULES_EXPR_VARIABLE_RESOLVER_H
#define AGENTFLOW_MODULES_EXPR_VARIABLE_RESOLVER_H

#include "context/execution_context.h" // 引入 ExecutionContext, LoopScopes
#include "expr/expression.h"
#include <string>
#include <unordered_set>

namespace agentflow {

// Roots that always resolve against the context and are never namespace-prefixed
bool is_reserved_root(const std::string& segment);

// Resolution order for the first segment of `$path`:
//   input, ctx, output, reply, loop  ->  loop iteration variables (innermost first)
//   ->  recorded node outputs (longest dotted prefix)  ->  top-level ctx keys
class VariableResolver : public VariableLookup {
public:
    VariableResolver(const ExecutionContext& context, const LoopScopes& scopes)
        : context_(context), scopes_(scopes) {}

    Value lookup(const VariablePath& path) const override;

    Value evaluate(const std::string& expr) const { return evaluate_expression(expr, *this); }
    bool condition(const std::string& expr) const { return evaluate_condition(expr, *this); }

    // Evaluates call arguments: string leaves that parse as expressions are evaluated,
    // other strings stay literal; arrays and objects recurse.
    Value evaluate_arguments(const Value& args) const;

private:
    const ExecutionContext& context_;
    const LoopScopes& scopes_;
};

// `$charge.output` -> `$payment.charge.output` when "charge" is one of `local_roots`.
// Reserved roots are left alone.
std::string prefix_references(const std::string& expr, const std::string& alias,
                              const std::unordered_set<std::string>& local_roots);

// First dotted segment of every id ("payment.charge" -> "payment")
std::unordered_set<std::string> root_segments(const std::unordered_set<std::string>& ids);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_EXPR_VARIABLE_RESOLVER_H
