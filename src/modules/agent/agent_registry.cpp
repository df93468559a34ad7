// modules/agent/agent_registry.cpp
#include "agent/agent_registry.h"
#include "common/utils/logger.h"
#include "common/utils/path_utils.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <algorithm>

namespace agentflow {

namespace {

std::string text_field(const Value& doc, const char* key, const std::string& origin) {
    if (!doc.contains(key) || doc[key].is_null()) return "";
    if (!doc[key].is_string()) {
        throw FlowError(ErrorCode::PARSE_ERROR, origin + ": '" + key + "' must be a string");
    }
    return doc[key].get<std::string>();
}

} // namespace

AgentResource AgentRegistry::from_value(const Value& doc, const std::string& origin, const std::string& base_dir) {
    if (!doc.is_object()) throw FlowError(ErrorCode::PARSE_ERROR, origin + ": agent must be a mapping");

    AgentResource agent;
    agent.slug = text_field(doc, "slug", origin);
    agent.name = text_field(doc, "name", origin);
    agent.description = text_field(doc, "description", origin);
    if (doc.contains("model")) agent.model = text_field(doc, "model", origin);
    if (doc.contains("temperature")) {
        if (!doc["temperature"].is_number()) {
            throw FlowError(ErrorCode::PARSE_ERROR, origin + ": 'temperature' must be a number");
        }
        agent.temperature = doc["temperature"].get<double>();
    }
    agent.system_prompt = text_field(doc, "system_prompt", origin);
    agent.system_prompt_slug = text_field(doc, "system_prompt_slug", origin);
    if (doc.contains("tools")) agent.tools = doc["tools"];

    std::string workflow = text_field(doc, "workflow", origin);
    if (!workflow.empty()) agent.workflow = resolve_path(base_dir, workflow);

    if (doc.contains("returns")) {
        const Value& returns = doc["returns"];
        if (returns.is_string()) {
            agent.returns.push_back(returns.get<std::string>());
        } else if (returns.is_array()) {
            for (const auto& key : returns) agent.returns.push_back(value::to_display(key));
        } else {
            throw FlowError(ErrorCode::PARSE_ERROR, origin + ": 'returns' must be a key or a list of keys");
        }
    }
    agent.source_path = origin;
    return agent;
}

void AgentRegistry::register_agent(AgentResource agent) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (agents_.count(agent.slug)) log_warning("Agent '" + agent.slug + "' redefined");
    std::string slug = agent.slug;
    agents_[slug] = std::move(agent);
}

AgentResource AgentRegistry::load_file(const std::string& path) {
    AgentResource agent = from_value(load_yaml_file(path), path, parent_dir(path));
    if (agent.slug.empty()) agent.slug = file_stem(path);
    if (agent.name.empty()) agent.name = agent.slug;
    register_agent(agent);
    return agent;
}

bool AgentRegistry::has_agent(const std::string& slug) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.count(slug) > 0;
}

std::optional<AgentResource> AgentRegistry::find(const std::string& slug) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(slug);
    if (it == agents_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> AgentRegistry::list_agents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> slugs;
    for (const auto& [slug, _] : agents_) slugs.push_back(slug);
    std::sort(slugs.begin(), slugs.end());
    return slugs;
}

} // namespace agentflow
