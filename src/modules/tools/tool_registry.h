// modules/tools/tool_registry.h
#ifndef AGENTFLOW_MODULES_TOOLS_TOOL_REGISTRY_H
#define AGENTFLOW_MODULES_TOOLS_TOOL_REGISTRY_H

#include "core/types/context.h"
#include "core/types/errors.h"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

// A named bundle of tool definitions, loaded from a JSON tool file:
//   {"slug": "search", "name": "Search", "description": "...", "tools": [ ... ]}
struct ToolResource {
    std::string slug;
    std::string name;
    std::string description;
    Value tools = Value::array(); // {"type":"function","function":{name, description, parameters}}
};

// Normalizes {"name":..,"parameters":..} or the full function-calling shape.
// throws InvalidArgument when no name can be found.
Value normalize_tool_definition(const Value& def);
std::string tool_definition_name(const Value& def);

class ToolRegistry {
public:
    void register_bundle(ToolResource bundle);
    // throws ParseError
    ToolResource load_bundle_file(const std::string& path);

    bool has_bundle(const std::string& slug) const;
    // throws ToolResolutionError
    ToolResource get_bundle(const std::string& slug) const;
    std::vector<std::string> list_bundles() const;

    // Tools offered to one agent call.
    //   call_tools: the call's `tools` argument (inline list, "@slug", "slug", "a, b",
    //               JSON text, or a list mixing slugs and inline definitions)
    //   agent_tools: the agent's default, same shapes
    // The call wins over the agent; bundles are unioned, later same-named tools replace earlier ones.
    Value resolve_tools(const Value& call_tools, const Value& agent_tools) const;

private:
    void append_reference(const Value& ref, Value& out) const;
    void append_slug(std::string slug, Value& out) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ToolResource> bundles_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_TOOLS_TOOL_REGISTRY_H
