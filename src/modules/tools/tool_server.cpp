// modules/tools/tool_server.cpp
#include "tools/tool_server.h"
#include "common/utils/logger.h"
#include "tools/tool_registry.h"
#include <algorithm>

namespace agentflow {

JsonRpcToolServer::JsonRpcToolServer(std::string name, std::unique_ptr<JsonRpcTransport> transport)
    : name_(std::move(name)), transport_(std::move(transport)) {}

Value JsonRpcToolServer::rpc(const std::string& method, Value params) {
    Value message = {{"jsonrpc", "2.0"}, {"id", next_id_++}, {"method", method}, {"params", std::move(params)}};
    Value response = transport_->request(message);

    if (response.contains("error") && !response["error"].is_null()) {
        const Value& err = response["error"];
        std::string text = err.is_object() ? err.value("message", err.dump()) : err.dump();
        throw FlowError(ErrorCode::CALL_FAILURE, name_ + ": " + method + " failed: " + text, {},
                        Value{{"server", name_}, {"method", method}, {"error", err}});
    }
    if (!response.contains("result")) {
        throw FlowError(ErrorCode::CALL_FAILURE, name_ + ": " + method + ": response without result");
    }
    return response["result"];
}

void JsonRpcToolServer::ensure_initialized() {
    if (initialized_) return;
    Value result = rpc("initialize", {{"protocolVersion", "2024-11-05"},
                                      {"capabilities", Value::object()},
                                      {"clientInfo", {{"name", "agentflow"}, {"version", "0.1.0"}}}});
    transport_->notify({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    if (result.contains("serverInfo")) log_debug("Tool server '" + name_ + "' ready: " + result["serverInfo"].dump());
    initialized_ = true;
}

Value JsonRpcToolServer::list_tools() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_initialized();
    Value result = rpc("tools/list", Value::object());

    Value out = Value::array();
    if (!result.contains("tools") || !result["tools"].is_array()) return out;
    for (const auto& tool : result["tools"]) {
        // servers describe inputs as `inputSchema`
        Value def = {{"name", tool.value("name", "")},
                     {"description", tool.value("description", "")},
                     {"parameters", tool.value("inputSchema", Value{{"type", "object"}})}};
        out.push_back(normalize_tool_definition(def));
    }
    return out;
}

Value JsonRpcToolServer::call_tool(const std::string& name, const Value& args) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_initialized();
    Value result = rpc("tools/call", {{"name", name}, {"arguments", args.is_null() ? Value::object() : args}});

    std::string text;
    if (result.contains("content") && result["content"].is_array()) {
        for (const auto& part : result["content"]) {
            if (part.value("type", "") == "text") text += part.value("text", "");
        }
    }
    if (result.value("isError", false)) {
        throw FlowError(ErrorCode::CALL_FAILURE, name_ + "." + name + ": " + text, {},
                        Value{{"server", name_}, {"tool", name}});
    }
    if (result.contains("structuredContent")) return result["structuredContent"];
    return text;
}

void ToolServerRegistry::add_server(const std::string& tool_namespace, std::shared_ptr<ToolServerClient> server) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (servers_.count(tool_namespace)) log_warning("Tool server namespace '" + tool_namespace + "' replaced");
    servers_[tool_namespace] = std::move(server);
}

bool ToolServerRegistry::has_server(const std::string& tool_namespace) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.count(tool_namespace) > 0;
}

std::vector<std::string> ToolServerRegistry::namespaces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [ns, _] : servers_) out.push_back(ns);
    std::sort(out.begin(), out.end());
    return out;
}

bool ToolServerRegistry::resolve(const std::string& qualified, std::shared_ptr<ToolServerClient>& server,
                                 std::string& tool) const {
    auto dot = qualified.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == qualified.size()) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(qualified.substr(0, dot));
    if (it == servers_.end()) return false;
    server = it->second;
    tool = qualified.substr(dot + 1);
    return true;
}

Value ToolServerRegistry::list_tools() const {
    std::vector<std::pair<std::string, std::shared_ptr<ToolServerClient>>> servers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        servers.assign(servers_.begin(), servers_.end());
    }
    Value out = Value::array();
    for (const auto& [ns, server] : servers) {
        for (auto def : server->list_tools()) {
            def["function"]["name"] = ns + "." + def["function"]["name"].get<std::string>();
            out.push_back(std::move(def));
        }
    }
    return out;
}

} // namespace agentflow
