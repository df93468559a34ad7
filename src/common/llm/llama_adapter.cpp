#include "common/llm/llama_adapter.h"
#include "common/utils/logger.h"
#include "core/types/errors.h"
#include <vector>

namespace agentflow {

LlamaChatModel::LlamaChatModel(const ModelConfig& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free),
      sampler_(nullptr, llama_sampler_free) {

    llama_backend_init();

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = 99; // Use all GPU layers if available

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw FlowError(ErrorCode::CALL_FAILURE, "Failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw FlowError(ErrorCode::CALL_FAILURE, "Failed to create llama context");
    }
    ctx_.reset(raw_ctx);

    auto smpl_params = llama_sampler_chain_default_params();
    llama_sampler* raw_sampler = llama_sampler_chain_init(smpl_params);
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_temp(config_.temperature));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    sampler_.reset(raw_sampler);

    log_info("Loaded model " + config_.model_path);
}

LlamaChatModel::~LlamaChatModel() = default;

bool LlamaChatModel::is_loaded() const {
    return model_ != nullptr && ctx_ != nullptr && sampler_ != nullptr;
}

std::vector<llama_token> LlamaChatModel::tokenize(const std::string& text, bool add_bos) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    int32_t n_tokens = -llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                       nullptr, 0, add_bos, true);
    if (n_tokens <= 0) return {};

    std::vector<llama_token> tokens(n_tokens);
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, add_bos, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaChatModel::detokenize(llama_token token) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, n);
}

std::string LlamaChatModel::apply_chat_template(const std::vector<ChatMessage>& messages) {
    std::vector<llama_chat_message> chat;
    chat.reserve(messages.size());
    for (const auto& m : messages) {
        // tool results are replayed as user turns; the local model has no tool role
        const char* role = (m.role == "tool") ? "user" : m.role.c_str();
        chat.push_back({role, m.content.c_str()});
    }

    const char* tmpl = llama_model_chat_template(model_.get(), nullptr);
    std::vector<char> buf(4096);
    int32_t n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true,
                                          buf.data(), static_cast<int32_t>(buf.size()));
    if (n > static_cast<int32_t>(buf.size())) {
        buf.resize(n);
        n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true,
                                      buf.data(), static_cast<int32_t>(buf.size()));
    }
    if (n < 0) {
        throw FlowError(ErrorCode::CALL_FAILURE, "Failed to apply chat template");
    }
    return std::string(buf.data(), n);
}

std::string LlamaChatModel::generate(const std::string& prompt, const TokenCallback& on_token, int& n_generated) {
    // 每次对话都从空的 KV cache 开始
    llama_memory_clear(llama_get_memory(ctx_.get()), true);

    auto tokens = tokenize(prompt, true);
    if (tokens.empty()) {
        throw FlowError(ErrorCode::CALL_FAILURE, "Tokenization failed");
    }

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        throw FlowError(ErrorCode::CALL_FAILURE, "Prompt evaluation failed");
    }

    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    std::string response;
    n_generated = 0;
    for (int i = 0; i < config_.n_predict; ++i) {
        llama_token new_token = llama_sampler_sample(sampler_.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, new_token)) break;

        std::string piece = detokenize(new_token);
        response += piece;
        ++n_generated;
        if (on_token) on_token(piece);

        batch = llama_batch_get_one(&new_token, 1);
        if (llama_decode(ctx_.get(), batch)) break;
    }
    llama_sampler_reset(sampler_.get());
    return response;
}

ChatResponse LlamaChatModel::chat(const ChatRequest& request, const TokenCallback& on_token) {
    if (!is_loaded()) {
        throw FlowError(ErrorCode::CALL_FAILURE, "Model not loaded");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    std::string chat_id = request.chat_id.value_or("");
    auto known = conversations_.find(chat_id);
    std::vector<ChatMessage> history;
    if (known != conversations_.end()) history = known->second;

    std::vector<ChatMessage> messages;
    if (!request.system_prompt.empty()) messages.push_back({"system", request.system_prompt, {}, {}});
    messages.insert(messages.end(), history.begin(), history.end());
    messages.insert(messages.end(), request.messages.begin(), request.messages.end());

    int n_generated = 0;
    std::string text = generate(apply_chat_template(messages), request.stream ? on_token : TokenCallback{}, n_generated);

    if (request.remember) {
        if (known == conversations_.end()) {
            chat_id = "local-" + std::to_string(next_chat_id_++);
            conversation_order_.push_back(chat_id);
            while (conversation_order_.size() > kMaxConversations) {
                conversations_.erase(conversation_order_.front());
                conversation_order_.pop_front();
            }
        }
        auto& stored = conversations_[chat_id];
        stored = std::move(history);
        stored.insert(stored.end(), request.messages.begin(), request.messages.end());
        stored.push_back({"assistant", text, {}, {}});
    } else if (known == conversations_.end()) {
        chat_id.clear();
    }

    ChatResponse response;
    response.content = std::move(text);
    response.finish_reason = n_generated >= config_.n_predict ? "length" : "stop";
    response.tokens = n_generated;
    response.model = request.model.empty() ? config_.model_path : request.model;
    response.chat_id = chat_id;
    return response;
}

} // namespace agentflow
