// modules/tools/tool_server.h
#ifndef AGENTFLOW_MODULES_TOOLS_TOOL_SERVER_H
#define AGENTFLOW_MODULES_TOOLS_TOOL_SERVER_H

#include "core/types/context.h"
#include "core/types/errors.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

// An externally hosted tool provider
class ToolServerClient {
public:
    virtual ~ToolServerClient() = default;

    // OpenAI function-calling shaped definitions
    virtual Value list_tools() = 0;
    // throws CallFailure when the server reports an error
    virtual Value call_tool(const std::string& name, const Value& args) = 0;
};

// Carries one JSON-RPC message out and the matching response back
class JsonRpcTransport {
public:
    virtual ~JsonRpcTransport() = default;
    virtual Value request(const Value& message) = 0;
    // no response expected
    virtual void notify(const Value& message) = 0;
};

// JSON-RPC 2.0 tool server client: initialize, tools/list, tools/call
class JsonRpcToolServer : public ToolServerClient {
public:
    JsonRpcToolServer(std::string name, std::unique_ptr<JsonRpcTransport> transport);

    Value list_tools() override;
    Value call_tool(const std::string& name, const Value& args) override;

    const std::string& name() const { return name_; }

private:
    Value rpc(const std::string& method, Value params);
    void ensure_initialized();

    std::string name_;
    std::unique_ptr<JsonRpcTransport> transport_;
    std::mutex mutex_; // one request in flight per server
    bool initialized_ = false;
    int64_t next_id_ = 1;
};

// "namespace.tool" -> server
class ToolServerRegistry {
public:
    void add_server(const std::string& tool_namespace, std::shared_ptr<ToolServerClient> server);

    bool has_server(const std::string& tool_namespace) const;
    std::vector<std::string> namespaces() const;

    // Splits "ns.tool" at the first dot; false when no registered namespace matches
    bool resolve(const std::string& qualified, std::shared_ptr<ToolServerClient>& server, std::string& tool) const;

    // Every server's tools, names qualified with their namespace
    Value list_tools() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ToolServerClient>> servers_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_TOOLS_TOOL_SERVER_H
