// modules/agent/chat_tool.h
#ifndef AGENTFLOW_MODULES_AGENT_CHAT_TOOL_H
#define AGENTFLOW_MODULES_AGENT_CHAT_TOOL_H

#include "agent/agent_registry.h"
#include "tools/builtin_registry.h"
#include <string>

namespace agentflow {

// Visibility of one agent call.
//   context_visible  persist + stream (default)
//   context_hidden   persist
//   display_only     stream
//   silent           neither
// "in:out" takes persistence from `in` and streaming from `out`.
struct ChatMode {
    std::string input_state = "context_visible";
    std::string output_state = "context_visible";
    bool persist = true;
    bool stream = true;
};

// From `state` / `stateless` arguments. throws InvalidArgument for an unknown state name.
ChatMode parse_chat_mode(const Value& args);

bool is_known_chat_state(const std::string& state);

// chat(message, agent?, system_prompt?, tools?, state?, stateless?, chat_id?, model?, temperature?, format?)
class ChatTool : public BuiltinTool {
public:
    std::string name() const override { return "chat"; }
    std::string description() const override { return "Call an agent"; }
    std::vector<std::string> required_params() const override { return {"message"}; }

    ToolOutcome call(const Value& args, ToolCallContext& tc) override;

private:
    Value run_agent_workflow(const AgentResource& agent, const Value& message, const ChatMode& mode,
                             ToolCallContext& tc) const;
    Value run_model_loop(const AgentResource* agent, const Value& args, const ChatMode& mode,
                         ToolCallContext& tc) const;
    std::string system_prompt(const AgentResource* agent, const Value& args, ToolCallContext& tc) const;
};

void register_chat_builtin(BuiltinRegistry& registry);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_AGENT_CHAT_TOOL_H
