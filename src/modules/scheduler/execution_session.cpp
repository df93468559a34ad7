// modules/scheduler/execution_session.cpp
#include "scheduler/execution_session.h"
#include "budget/budget_controller.h"
#include "common/utils/logger.h"
#include "expr/variable_resolver.h"
#include "tools/tool_dispatcher.h"

namespace agentflow {

ExecutionSession::ExecutionSession(RunServices& services, EventChannel& events, TraceExporter& traces,
                                   BodyRunner body_runner)
    : services_(services), events_(events), traces_(traces), body_runner_(std::move(body_runner)) {}

Value ExecutionSession::budget_snapshot() const {
    return services_.budget ? services_.budget->snapshot() : Value::object();
}

NodeResult ExecutionSession::execute_node(const Node& node, ExecutionContext& context, const LoopScopes& scopes) {
    NodeResult result;
    result.node = node.id;

    Value ctx_before = context.ctx();
    traces_.on_node_start(node.id, node.kind, budget_snapshot());
    events_.emit("node_start", node.id, Value{{"kind", to_string(node.kind)}});

    try {
        services_.cancel.throw_if_cancelled(node.id);
        if (services_.budget) services_.budget->consume_node(node.id);

        switch (node.kind) {
        case NodeKind::CALL:
            result.value = execute_call(static_cast<const CallNode&>(node), context, scopes, result);
            break;
        case NodeKind::LITERAL:
            result.value = VariableResolver(context, scopes).evaluate_arguments(static_cast<const LiteralNode&>(node).value);
            break;
        case NodeKind::FOREACH:
            result.value = execute_foreach(static_cast<const ForEachNode&>(node), context, scopes);
            break;
        case NodeKind::WHILE:
            result.value = execute_while(static_cast<const WhileNode&>(node), context, scopes);
            break;
        }

        if (result.persist) context.record_output(node.id, result.value);
        result.success = true;
    } catch (const FlowError& e) {
        result.error = e.at_node(node.id).info();
    } catch (const std::exception& e) {
        result.error = ErrorInfo{ErrorCode::CALL_FAILURE, e.what(), node.id, nullptr};
    }

    if (result.success) {
        traces_.on_node_end(node.id, "done", std::nullopt, ctx_before, context.ctx(), budget_snapshot());
        Value data = {{"persist", result.persist}, {"stream", result.stream}};
        // context_hidden replies stay off the observer stream
        if (result.persist && result.stream) data["output"] = result.value;
        events_.emit("node_complete", node.id, std::move(data));
    } else {
        log_debug("Node '" + node.id + "' failed: " + result.error->message);
        traces_.on_node_end(node.id, "failed", to_string(result.error->code), ctx_before, context.ctx(),
                            budget_snapshot());
        events_.emit("error", node.id, result.error->to_value());
    }
    return result;
}

Value ExecutionSession::execute_call(const CallNode& node, ExecutionContext& context, const LoopScopes& scopes,
                                     NodeResult& result) {
    if (!services_.dispatcher) {
        throw FlowError(ErrorCode::TOOL_RESOLUTION_ERROR, "No dispatcher for '" + node.target + "'", node.id);
    }
    Value args = VariableResolver(context, scopes).evaluate_arguments(node.arguments);
    ToolCallContext tc{node.id, context, scopes, events_, services_};
    DispatchResult dispatched = services_.dispatcher->dispatch(node.target, args, tc);
    result.persist = dispatched.persist;
    result.stream = dispatched.stream;
    return std::move(dispatched.value);
}

Value ExecutionSession::run_iteration(const Node& loop, const WorkflowGraph& body, ExecutionContext& context,
                                      const LoopScopes& scopes, int64_t iteration) {
    services_.cancel.throw_if_cancelled(loop.id);
    try {
        return body_runner_(body, context, scopes);
    } catch (const FlowError& e) {
        ErrorInfo inner = e.info();
        throw FlowError(e.code(), "Loop body failed at iteration " + std::to_string(iteration) + ": " + e.what(),
                        loop.id, Value{{"iteration", iteration}, {"error", inner.to_value()}});
    }
}

Value ExecutionSession::execute_foreach(const ForEachNode& node, ExecutionContext& context, const LoopScopes& scopes) {
    Value collection = VariableResolver(context, scopes).evaluate(node.collection_expr);

    Value items;
    if (collection.is_null()) {
        items = Value::array();
    } else if (collection.is_array()) {
        items = std::move(collection);
    } else if (collection.is_object()) {
        // objects iterate as {key, value} entries
        items = Value::array();
        for (auto it = collection.begin(); it != collection.end(); ++it) {
            items.push_back(Value{{"key", it.key()}, {"value", it.value()}});
        }
    } else {
        throw FlowError(ErrorCode::EVAL_ERROR,
                        "foreach expects a list, got " + value::type_name(collection) + " from " + node.collection_expr,
                        node.id);
    }

    Value results = Value::array();
    const int64_t count = static_cast<int64_t>(items.size());
    for (int64_t i = 0; i < count; ++i) {
        LoopScopes inner = scopes;
        inner.push_back(LoopScope{node.iteration_var, items[static_cast<size_t>(i)], i, i == 0, i == count - 1});
        results.push_back(run_iteration(node, *node.body, context, inner, i));
    }
    return results;
}

Value ExecutionSession::execute_while(const WhileNode& node, ExecutionContext& context, const LoopScopes& scopes) {
    const int max_iterations = services_.budget ? services_.budget->max_loop_iterations() : 100;

    Value results = Value::array();
    for (int64_t i = 0;; ++i) {
        LoopScopes inner = scopes;
        inner.push_back(LoopScope{"", nullptr, i, i == 0, false});
        if (!VariableResolver(context, inner).condition(node.condition_expr)) break;
        if (max_iterations >= 0 && i >= max_iterations) {
            throw FlowError(ErrorCode::BUDGET_EXCEEDED,
                            "while loop exceeded " + std::to_string(max_iterations) + " iterations", node.id,
                            Value{{"max_loop_iterations", max_iterations}});
        }
        results.push_back(run_iteration(node, *node.body, context, inner, i));
    }
    return results;
}

} // namespace agentflow
