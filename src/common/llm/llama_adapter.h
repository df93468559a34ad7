#ifndef AGENTFLOW_COMMON_LLM_LLAMA_ADAPTER_H
#define AGENTFLOW_COMMON_LLM_LLAMA_ADAPTER_H

#include "common/llm/model_client.h"
#include <llama.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <deque>
#include <vector>

namespace agentflow {

// ModelClient backed by a local GGUF model. Tool schemas are ignored; the model
// always answers with final text. Conversations of remembering calls are kept in
// memory by chat_id, oldest dropped first past kMaxConversations.
class LlamaChatModel : public ModelClient {
public:
    explicit LlamaChatModel(const ModelConfig& config);
    ~LlamaChatModel() override;

    ChatResponse chat(const ChatRequest& request, const TokenCallback& on_token) override;
    bool is_loaded() const;

private:
    ModelConfig config_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;
    std::mutex mutex_; // one llama_context, one generation at a time
    static constexpr size_t kMaxConversations = 64;

    std::map<std::string, std::vector<ChatMessage>> conversations_;
    std::deque<std::string> conversation_order_;
    int next_chat_id_ = 1;

    std::string apply_chat_template(const std::vector<ChatMessage>& messages);
    std::string generate(const std::string& prompt, const TokenCallback& on_token, int& n_generated);
    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_LLM_LLAMA_ADAPTER_H
