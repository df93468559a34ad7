#ifndef AGENTFLOW_COMMON_CONFIG_ENGINE_CONFIG_H
#define AGENTFLOW_COMMON_CONFIG_ENGINE_CONFIG_H

#include "common/llm/model_client.h" // 引入 ModelConfig
#include "core/types/budget.h"       // 引入 ExecutionBudget
#include "core/types/context.h"
#include <string>
#include <vector>

namespace agentflow {

// One external tool server, spoken to over JSON-RPC on a child process' stdio
struct ToolServerConfig {
    std::string name;
    std::string alias;                // optional, namespace defaults to name
    std::vector<std::string> command; // argv
    Value env = Value::object();

    const std::string& tool_namespace() const { return alias.empty() ? name : alias; }
};

struct EngineConfig {
    ModelConfig model;
    bool model_enabled = false; // true once a model_path is configured

    ExecutionBudget limits;
    int max_parallel = 8;

    bool client_bridge_enabled = false;
    int client_bridge_timeout_sec = 120;

    std::vector<ToolServerConfig> tool_servers;
    std::string log_level = "info";
};

// Reads agentflow.json. A missing file or malformed fields fall back to defaults.
EngineConfig load_engine_config(const std::string& config_path = "agentflow.json");

// Relative model paths resolve against `base_dir`
EngineConfig parse_engine_config(const Value& j, const std::string& base_dir = ".");

} // namespace agentflow

#endif // AGENTFLOW_COMMON_CONFIG_ENGINE_CONFIG_H
