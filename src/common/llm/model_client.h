#ifndef AGENTFLOW_COMMON_LLM_MODEL_CLIENT_H
#define AGENTFLOW_COMMON_LLM_MODEL_CLIENT_H

#include "core/types/context.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

// Local model settings (llama.cpp backend)
struct ModelConfig {
    std::string model_path;
    int n_ctx = 2048;
    int n_threads = 4;
    float temperature = 0.7f;
    float min_p = 0.05f;
    int n_predict = 512;
};

struct ToolCallRequest {
    std::string id;
    std::string name;
    Value arguments = Value::object();
};

struct ChatMessage {
    std::string role; // "system", "user", "assistant", "tool"
    std::string content;
    std::vector<ToolCallRequest> tool_calls; // assistant turns only
    std::string tool_call_id;                // tool turns only
};

struct ChatRequest {
    std::string model;
    std::string system_prompt;
    std::vector<ChatMessage> messages;
    double temperature = 0.7;
    Value tools = Value::array(); // OpenAI function-calling definitions
    std::optional<std::string> chat_id; // continue this conversation
    bool stream = true;
    bool remember = true; // false: the backend keeps no history for this call
};

struct ChatResponse {
    std::string content;
    std::vector<ToolCallRequest> tool_calls;
    std::string finish_reason = "stop";
    int tokens = 0;
    std::string model;
    std::string chat_id;

    bool has_tool_calls() const { return !tool_calls.empty(); }
};

using TokenCallback = std::function<void(const std::string&)>;

// The LLM collaborator. Implementations call `on_token` for every streamed piece.
class ModelClient {
public:
    virtual ~ModelClient() = default;
    virtual ChatResponse chat(const ChatRequest& request, const TokenCallback& on_token) = 0;
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_LLM_MODEL_CLIENT_H
