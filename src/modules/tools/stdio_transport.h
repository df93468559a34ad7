// modules/tools/stdio_transport.h
#ifndef AGENTFLOW_MODULES_TOOLS_STDIO_TRANSPORT_H
#define AGENTFLOW_MODULES_TOOLS_STDIO_TRANSPORT_H

#include "tools/tool_server.h"
#include <string>
#include <sys/types.h>
#include <vector>

namespace agentflow {

// Newline-delimited JSON-RPC with a child process over its stdin/stdout
class StdioTransport : public JsonRpcTransport {
public:
    // throws CallFailure when the process cannot be started
    StdioTransport(std::vector<std::string> command, const Value& env = Value::object(), int timeout_ms = 30000);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    Value request(const Value& message) override;
    void notify(const Value& message) override;

private:
    void write_line(const std::string& line);
    std::string read_line();
    void shutdown();

    std::vector<std::string> command_;
    int timeout_ms_;
    pid_t pid_ = -1;
    int to_child_ = -1;
    int from_child_ = -1;
    std::string buffer_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_TOOLS_STDIO_TRANSPORT_H
