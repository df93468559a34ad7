// modules/tools/tool_dispatcher.h
#ifndef AGENTFLOW_MODULES_TOOLS_TOOL_DISPATCHER_H
#define AGENTFLOW_MODULES_TOOLS_TOOL_DISPATCHER_H

#include "tools/tool_context.h"
#include <string>

namespace agentflow {

enum class DispatchRoute : uint8_t {
    BUILTIN,
    TOOL_SERVER,
    CLIENT
};

std::string to_string(DispatchRoute route);

struct DispatchResult {
    Value value = nullptr;
    bool persist = true;
    bool stream = true;
    bool executed_on_client = false; // ends an agent's tool-call loop
    DispatchRoute route = DispatchRoute::BUILTIN;
};

// Priority chain: builtin registry -> tool server ("namespace.tool") -> client bridge
class ToolDispatcher {
public:
    // throws ToolResolutionError when nothing can serve `target`
    DispatchResult dispatch(const std::string& target, const Value& args, ToolCallContext& tc) const;

    // true when the result marks a tool the client already executed
    static bool is_terminal(const Value& result);
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_TOOLS_TOOL_DISPATCHER_H
