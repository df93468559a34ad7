// modules/tools/tool_dispatcher.cpp
#include "tools/tool_dispatcher.h"
#include "common/utils/logger.h"
#include "tools/builtin_registry.h"
#include "tools/client_bridge.h"
#include "tools/tool_server.h"

namespace agentflow {

std::string to_string(DispatchRoute route) {
    switch (route) {
    case DispatchRoute::BUILTIN: return "builtin";
    case DispatchRoute::TOOL_SERVER: return "tool_server";
    case DispatchRoute::CLIENT: return "client";
    }
    return "unknown";
}

bool ToolDispatcher::is_terminal(const Value& result) {
    if (!result.is_object() || !result.contains("executed_on_client")) return false;
    return value::truthy(result["executed_on_client"]);
}

DispatchResult ToolDispatcher::dispatch(const std::string& target, const Value& args, ToolCallContext& tc) const {
    RunServices& services = tc.services;
    DispatchResult out;

    if (services.builtins && services.builtins->has_tool(target)) {
        ToolOutcome outcome = services.builtins->call_tool(target, args, tc);
        out.value = std::move(outcome.value);
        out.persist = outcome.persist;
        out.stream = outcome.stream;
        out.route = DispatchRoute::BUILTIN;
    } else {
        std::shared_ptr<ToolServerClient> server;
        std::string tool;
        if (services.servers && services.servers->resolve(target, server, tool)) {
            log_debug("Dispatching " + target + " to tool server");
            try {
                out.value = server->call_tool(tool, args);
            } catch (const FlowError& e) {
                throw e.at_node(tc.node);
            }
            out.route = DispatchRoute::TOOL_SERVER;
        } else if (services.bridge) {
            out.value = services.bridge->emit_and_await(target, args, tc.events, tc.node, services.cancel);
            out.route = DispatchRoute::CLIENT;
        } else {
            throw FlowError(ErrorCode::TOOL_RESOLUTION_ERROR, "No builtin, tool server or client for '" + target + "'",
                            tc.node, Value{{"target", target}});
        }
    }

    out.executed_on_client = is_terminal(out.value);
    return out;
}

} // namespace agentflow
