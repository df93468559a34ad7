// modules/tools/builtin_registry.cpp
#include "tools/builtin_registry.h"
#include "common/utils/logger.h"
#include <algorithm>

namespace agentflow {

void BuiltinRegistry::register_tool(std::unique_ptr<BuiltinTool> tool) {
    std::string name = tool->name();
    if (tools_.count(name)) log_debug("Replacing builtin '" + name + "'");
    tools_[name] = std::move(tool);
}

bool BuiltinRegistry::has_tool(const std::string& name) const {
    return tools_.count(name) > 0;
}

std::vector<std::string> BuiltinRegistry::list_tools() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

ToolOutcome BuiltinRegistry::call_tool(const std::string& name, const Value& args, ToolCallContext& tc) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        throw FlowError(ErrorCode::TOOL_RESOLUTION_ERROR, "Builtin not found: " + name, tc.node);
    }
    for (const auto& param : it->second->required_params()) {
        if (!args.is_object() || !args.contains(param) || args[param].is_null()) {
            throw FlowError(ErrorCode::MISSING_ARGUMENT, name + "() requires '" + param + "'", tc.node,
                            Value{{"tool", name}, {"argument", param}});
        }
    }
    return it->second->call(args, tc);
}

} // namespace agentflow
