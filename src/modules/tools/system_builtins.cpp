// modules/tools/system_builtins.cpp
#include "common/utils/logger.h"
#include "tools/builtin_registry.h"
#include <algorithm>
#include <chrono>
#include <thread>

namespace agentflow {

namespace {

std::string string_arg(const Value& args, const std::string& key, const std::string& fallback = "") {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) return fallback;
    return value::to_display(args[key]);
}

// set_context(path="a.b", value=..., mode="deep_merge") or set_context(key1=..., key2=...)
Value set_context(const Value& args, ToolCallContext& tc) {
    if (!args.is_object()) throw FlowError(ErrorCode::INVALID_ARGUMENT, "set_context() expects named arguments", tc.node);

    MergeStrategy strategy = MergeStrategy::REPLACE;
    if (args.contains("mode")) {
        try {
            strategy = parse_merge_strategy(string_arg(args, "mode"));
        } catch (const FlowError& e) {
            throw e.at_node(tc.node);
        }
    }

    Value written = Value::object();
    if (args.contains("path") && args.contains("value")) {
        std::string path = string_arg(args, "path");
        if (path.rfind("$ctx.", 0) == 0) path.erase(0, 5);
        if (path.empty()) throw FlowError(ErrorCode::INVALID_ARGUMENT, "set_context(): empty path", tc.node);
        tc.context.set(path, args["value"], strategy);
        written[path] = tc.context.get(path);
        return written;
    }

    for (auto it = args.begin(); it != args.end(); ++it) {
        if (it.key() == "path" || it.key() == "value" || it.key() == "mode") continue;
        tc.context.set(it.key(), it.value(), strategy);
        written[it.key()] = tc.context.get(it.key());
    }
    return written;
}

Value notify(const Value& args, ToolCallContext& tc) {
    std::string message = string_arg(args, "message");
    Value data = {{"message", message}, {"level", string_arg(args, "level", "info")}};
    if (args.contains("status") && !args["status"].is_null()) {
        std::string status = string_arg(args, "status");
        Value reply = tc.context.reply();
        reply["status"] = status;
        tc.context.set_reply(reply);
        data["status"] = status;
    }
    tc.events.emit("notify", tc.node, data);
    if (!message.empty()) log_info("[" + tc.node + "] " + message);
    return Value{{"status", "sent"}, {"content", message}};
}

// timer(ms=250) or timer(seconds=1); wakes early when the run is cancelled
Value timer(const Value& args, ToolCallContext& tc) {
    int64_t ms = 1000;
    if (args.contains("ms") && !args["ms"].is_null()) {
        ms = static_cast<int64_t>(value::to_number(args["ms"]));
    } else if (args.contains("seconds") && !args["seconds"].is_null()) {
        ms = static_cast<int64_t>(value::to_number(args["seconds"]) * 1000);
    }
    if (ms < 0) throw FlowError(ErrorCode::INVALID_ARGUMENT, "timer(): negative duration", tc.node);

    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (std::chrono::steady_clock::now() < until) {
        tc.services.cancel.throw_if_cancelled(tc.node);
        auto slice = std::min(until, std::chrono::steady_clock::now() + std::chrono::milliseconds(20));
        std::this_thread::sleep_until(slice);
    }
    return Value{{"status", "finished"}, {"duration_ms", ms}};
}

Value fail(const Value& args, ToolCallContext& tc) {
    Value details = args.is_object() && args.contains("details") ? args["details"] : Value(nullptr);
    throw FlowError(ErrorCode::CALL_FAILURE, string_arg(args, "message", "fail() called"), tc.node, details);
}

// workflow(path="modules/review.yaml", input={...}, returns=["summary"])
Value workflow(const Value& args, ToolCallContext& tc) {
    if (!tc.services.run_subworkflow) {
        throw FlowError(ErrorCode::TOOL_RESOLUTION_ERROR, "workflow(): sub-workflows are not available", tc.node);
    }
    SubWorkflowRequest request;
    request.path = string_arg(args, "path");
    request.identifier = "workflow:" + request.path;
    if (args.contains("input") && !args["input"].is_null()) request.input = args["input"];
    if (args.contains("returns")) {
        const Value& returns = args["returns"];
        if (returns.is_array()) {
            for (const auto& key : returns) request.returns.push_back(value::to_display(key));
        } else if (returns.is_string()) {
            request.returns.push_back(returns.get<std::string>());
        }
    }

    RunResult result = tc.services.run_subworkflow(request, tc);
    if (!result.success) {
        ErrorInfo inner = result.error.value_or(ErrorInfo{ErrorCode::CALL_FAILURE, result.message, {}, nullptr});
        throw FlowError(inner.code, "Sub-workflow '" + request.path + "' failed: " + inner.message, tc.node,
                        Value{{"workflow", request.path}, {"error", inner.to_value()}});
    }
    return result.output;
}

} // namespace

void register_system_builtins(BuiltinRegistry& registry) {
    registry.register_tool("set_context", set_context, {}, "Write values into the workflow context");
    registry.register_tool("notify", notify, {}, "Send a notification to the observer");
    registry.register_tool("timer", timer, {}, "Sleep for `ms` milliseconds");
    registry.register_tool("fail", fail, {}, "Raise a call failure");
    registry.register_tool("workflow", workflow, {"path"}, "Run a workflow module with its own context");
}

} // namespace agentflow
