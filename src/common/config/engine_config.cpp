#include "common/config/engine_config.h"
#include "common/utils/logger.h"
#include "common/utils/path_utils.h"
#include <fstream>
#include <thread>

namespace agentflow {

namespace {

void read_int(const Value& obj, const char* key, int& out) {
    if (obj.contains(key) && obj[key].is_number_integer()) {
        out = obj[key].get<int>();
    } else if (obj.contains(key)) {
        log_warning(std::string("Config field '") + key + "' is not an integer, using default");
    }
}

void read_float(const Value& obj, const char* key, float& out) {
    if (obj.contains(key) && obj[key].is_number()) {
        out = static_cast<float>(obj[key].get<double>());
    }
}

} // namespace

EngineConfig parse_engine_config(const Value& j, const std::string& base_dir) {
    EngineConfig config;
    int hw = static_cast<int>(std::thread::hardware_concurrency());
    config.model.n_threads = hw > 0 ? hw : 4;

    if (!j.is_object()) return config;

    if (j.contains("model") && j["model"].is_object()) {
        const auto& m = j["model"];
        if (m.contains("model_path") && m["model_path"].is_string()) {
            config.model.model_path = resolve_path(base_dir, m["model_path"].get<std::string>());
            config.model_enabled = true;
        }
        read_int(m, "n_ctx", config.model.n_ctx);
        int threads = 0;
        read_int(m, "n_threads", threads);
        if (threads > 0) config.model.n_threads = threads;
        read_float(m, "temperature", config.model.temperature);
        read_float(m, "min_p", config.model.min_p);
        read_int(m, "n_predict", config.model.n_predict);
    }

    if (j.contains("limits") && j["limits"].is_object()) {
        const auto& l = j["limits"];
        read_int(l, "max_nodes", config.limits.max_nodes);
        read_int(l, "max_model_calls", config.limits.max_model_calls);
        read_int(l, "max_duration_sec", config.limits.max_duration_sec);
        read_int(l, "max_loop_iterations", config.limits.max_loop_iterations);
        read_int(l, "max_call_depth", config.limits.max_call_depth);
        read_int(l, "max_tool_turns", config.limits.max_tool_turns);
        read_int(l, "max_parallel", config.max_parallel);
        if (config.max_parallel < 1) config.max_parallel = 1;
    }

    if (j.contains("client_bridge") && j["client_bridge"].is_object()) {
        const auto& b = j["client_bridge"];
        if (b.contains("enabled") && b["enabled"].is_boolean()) {
            config.client_bridge_enabled = b["enabled"].get<bool>();
        }
        read_int(b, "timeout_sec", config.client_bridge_timeout_sec);
    }

    if (j.contains("tool_servers") && j["tool_servers"].is_array()) {
        for (const auto& s : j["tool_servers"]) {
            if (!s.is_object() || !s.contains("name") || !s["name"].is_string()) {
                log_warning("Skipping tool server entry without a name");
                continue;
            }
            ToolServerConfig server;
            server.name = s["name"].get<std::string>();
            if (s.contains("alias") && s["alias"].is_string()) server.alias = s["alias"].get<std::string>();
            if (s.contains("command") && s["command"].is_array()) {
                for (const auto& arg : s["command"]) {
                    if (arg.is_string()) server.command.push_back(arg.get<std::string>());
                }
            }
            if (s.contains("env") && s["env"].is_object()) server.env = s["env"];
            if (server.command.empty()) {
                log_warning("Tool server '" + server.name + "' has no command, skipping");
                continue;
            }
            config.tool_servers.push_back(std::move(server));
        }
    }

    if (j.contains("logging") && j["logging"].is_object() &&
        j["logging"].contains("level") && j["logging"]["level"].is_string()) {
        config.log_level = j["logging"]["level"].get<std::string>();
    }
    return config;
}

EngineConfig load_engine_config(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        log_debug("No config at " + config_path + ", using defaults");
        return parse_engine_config(Value::object());
    }

    try {
        Value j;
        file >> j;
        return parse_engine_config(j, parent_dir(config_path));
    } catch (const Value::exception& e) {
        log_warning("Invalid config " + config_path + ": " + e.what() + ", using defaults");
        return parse_engine_config(Value::object());
    }
}

} // namespace agentflow
