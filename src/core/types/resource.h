#ifndef AGENTFLOW_TYPES_RESOURCE_H
#define AGENTFLOW_TYPES_RESOURCE_H

#include <cstdint>
#include <string>

namespace agentflow {

// 资源类型枚举
enum class ResourceKind : uint8_t {
    PROMPT,
    AGENT,
    TOOL,
    MODULE
};

std::string to_string(ResourceKind kind);

// A glob declared by a workflow unit (prompts: ["prompts/*.prompt"]).
// After merge `pattern` is resolved against the declaring unit's directory.
struct ResourcePattern {
    ResourceKind kind;
    std::string pattern;

    bool operator==(const ResourcePattern& other) const {
        return kind == other.kind && pattern == other.pattern;
    }
};

} // namespace agentflow

#endif // AGENTFLOW_TYPES_RESOURCE_H
