// modules/expr/variable_resolver.cpp
#include "expr/variable_resolver.h"
#include "context/value_path.h"
#include "common/utils/logger.h"

namespace agentflow {

bool is_reserved_root(const std::string& segment) {
    static const std::unordered_set<std::string> reserved = {
        "input", "ctx", "output", "reply", "loop", "error"
    };
    return reserved.count(segment) > 0;
}

Value VariableResolver::lookup(const VariablePath& path) const {
    if (path.empty()) return nullptr;
    const std::string& root = path.front();

    if (root == "input") return get_at_path(context_.input(), path, 1);
    if (root == "ctx") return context_.get(path, 1);
    if (root == "output") return get_at_path(context_.current_output(), path, 1);
    if (root == "reply") return get_at_path(context_.reply(), path, 1);
    if (root == "loop") {
        if (scopes_.empty()) return nullptr;
        return get_at_path(scopes_.back().loop_value(), path, 1);
    }

    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
        if (it->var == root) return get_at_path(it->item, path, 1);
    }

    if (auto match = context_.match_node(path)) {
        return get_at_path(context_.node_record(match->first), path, match->second);
    }

    // `$error.node` and plain `$name` read top-level ctx keys
    return context_.get(path, 0);
}

Value VariableResolver::evaluate_arguments(const Value& args) const {
    if (args.is_string()) {
        const auto& text = args.get_ref<const std::string&>();
        auto expr = Expression::try_parse(text);
        if (!expr) {
            log_debug("Argument is not an expression, using literal: " + text);
            return args;
        }
        return expr->evaluate(*this);
    }
    if (args.is_array()) {
        Value out = Value::array();
        for (const auto& item : args) out.push_back(evaluate_arguments(item));
        return out;
    }
    if (args.is_object()) {
        Value out = Value::object();
        for (auto it = args.begin(); it != args.end(); ++it) out[it.key()] = evaluate_arguments(it.value());
        return out;
    }
    return args;
}

std::string prefix_references(const std::string& expr, const std::string& alias,
                              const std::unordered_set<std::string>& local_roots) {
    return rewrite_variable_roots(expr, [&](const std::string& first) -> std::optional<std::string> {
        if (is_reserved_root(first) || !local_roots.count(first)) return std::nullopt;
        return alias + "." + first;
    });
}

std::unordered_set<std::string> root_segments(const std::unordered_set<std::string>& ids) {
    std::unordered_set<std::string> roots;
    for (const auto& id : ids) roots.insert(id.substr(0, id.find('.')));
    return roots;
}

} // namespace agentflow
