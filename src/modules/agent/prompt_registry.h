// modules/agent/prompt_registry.h
#ifndef AGENTFLOW_MODULES_AGENT_PROMPT_REGISTRY_H
#define AGENTFLOW_MODULES_AGENT_PROMPT_REGISTRY_H

#include "core/types/context.h"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

class BuiltinRegistry;

// A prompt file: optional YAML front matter, then an inja template body
//
//   ---
//   slug: greet
//   inputs: {tone: friendly}
//   ---
//   Say hello to {{ name }} in a {{ tone }} way.
struct PromptResource {
    std::string slug;
    std::string name;
    std::string description;
    Value inputs = Value::object(); // default template variables
    std::string content;
};

class PromptRegistry {
public:
    // throws ParseError for broken front matter
    static PromptResource parse(const std::string& text, const std::string& origin = "<string>");

    void register_prompt(PromptResource prompt);
    PromptResource load_file(const std::string& path);

    bool has_prompt(const std::string& slug) const;
    std::optional<PromptResource> find(const std::string& slug) const;
    std::vector<std::string> list_prompts() const;

    // inputs defaults, overlaid by `vars`. throws ToolResolutionError for an unknown slug.
    std::string render(const std::string& slug, const Value& vars) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PromptResource> prompts_;
};

// prompt(slug="greet", name=$input.name)
void register_prompt_builtin(BuiltinRegistry& registry);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_AGENT_PROMPT_REGISTRY_H
