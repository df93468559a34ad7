// modules/tools/tool_context.h
#ifndef AGENTFLOW_MODULES_TOOLS_TOOL_CONTEXT_H
#define AGENTFLOW_MODULES_TOOLS_TOOL_CONTEXT_H

#include "context/execution_context.h" // 引入 ExecutionContext, LoopScopes
#include "core/types/event.h"          // 引入 EventChannel
#include "core/types/result.h"         // 引入 RunResult
#include "scheduler/cancellation.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace agentflow {

class BuiltinRegistry;
class ToolRegistry;
class ToolServerRegistry;
class ClientBridge;
class ToolDispatcher;
class AgentRegistry;
class PromptRegistry;
class ModelClient;
class BudgetController;
struct ToolCallContext;

// A runtime sub-workflow: fresh ExecutionContext, explicit input, selected ctx keys copied back
struct SubWorkflowRequest {
    std::string identifier;           // pushed on the execution stack, e.g. "agent:flows/triage.yaml"
    std::string path;                 // workflow file
    Value input = Value::object();
    std::vector<std::string> returns; // ctx keys copied into the caller
};

using SubWorkflowRunner = std::function<RunResult(const SubWorkflowRequest&, ToolCallContext&)>;

// Services shared by every node of one run. Non-owning; the engine owns them.
struct RunServices {
    BuiltinRegistry* builtins = nullptr;
    ToolRegistry* tools = nullptr;
    ToolServerRegistry* servers = nullptr;
    ClientBridge* bridge = nullptr; // null when no client is attached
    ToolDispatcher* dispatcher = nullptr;
    AgentRegistry* agents = nullptr;
    PromptRegistry* prompts = nullptr;
    std::shared_ptr<ModelClient> model;
    BudgetController* budget = nullptr;
    CancellationToken cancel;
    SubWorkflowRunner run_subworkflow;
};

// What a builtin sees while it runs inside a node
struct ToolCallContext {
    NodeId node;
    ExecutionContext& context;
    const LoopScopes& scopes;
    EventChannel& events;
    RunServices& services;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_TOOLS_TOOL_CONTEXT_H
