// modules/agent/agent_registry.h
#ifndef AGENTFLOW_MODULES_AGENT_AGENT_REGISTRY_H
#define AGENTFLOW_MODULES_AGENT_AGENT_REGISTRY_H

#include "core/types/context.h"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

// An agent definition file (YAML):
//
//   slug: reviewer
//   model: gpt-4o
//   temperature: 0.2
//   system_prompt: "You review code."     # or system_prompt_slug: review-system
//   tools: ["@devtools", "search"]
//   workflow: flows/review.yaml           # optional runtime sub-workflow
//   returns: [verdict]
struct AgentResource {
    std::string slug;
    std::string name;
    std::string description;
    std::string model = "gpt-4o";
    double temperature = 0.7;
    std::string system_prompt;
    std::string system_prompt_slug;
    Value tools = nullptr;
    std::string workflow; // resolved against the agent file's directory
    std::vector<std::string> returns;
    std::string source_path;

    bool has_workflow() const { return !workflow.empty(); }
};

class AgentRegistry {
public:
    // throws ParseError
    static AgentResource from_value(const Value& doc, const std::string& origin, const std::string& base_dir = ".");

    void register_agent(AgentResource agent);
    AgentResource load_file(const std::string& path);

    bool has_agent(const std::string& slug) const;
    std::optional<AgentResource> find(const std::string& slug) const;
    std::vector<std::string> list_agents() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, AgentResource> agents_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_AGENT_AGENT_REGISTRY_H
