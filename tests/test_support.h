// tests/test_support.h
#ifndef AGENTFLOW_TESTS_TEST_SUPPORT_H
#define AGENTFLOW_TESTS_TEST_SUPPORT_H

#include "agentflow/core/engine.h"
#include "common/utils/path_utils.h"
#include "graph/workflow_loader.h"
#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace agentflow::testing {

// mkdtemp directory, removed on scope exit
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "agentflow-XXXXXX").string();
        if (!mkdtemp(tmpl.data())) throw std::runtime_error("mkdtemp failed");
        root_ = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path(const std::string& rel = "") const { return rel.empty() ? root_ : root_ + "/" + rel; }

    std::string write(const std::string& rel, const std::string& content) const {
        std::string full = path(rel);
        write_text_file(full, content);
        return full;
    }

private:
    std::string root_;
};

inline EngineConfig quiet_config() {
    EngineConfig config;
    config.log_level = "warning";
    return config;
}

inline std::unique_ptr<WorkflowEngine> engine_from_yaml(const std::string& yaml,
                                                        EngineConfig config = quiet_config(),
                                                        const std::string& base_dir = ".") {
    auto engine = std::make_unique<WorkflowEngine>(std::move(config));
    engine->load_graph(WorkflowLoader::load_string(yaml, "test.yaml"), base_dir);
    return engine;
}

inline RunResult run_yaml(const std::string& yaml, const Value& input = Value::object()) {
    auto engine = engine_from_yaml(yaml);
    return engine->run(input);
}

inline size_t count_status(const std::vector<TraceRecord>& traces, const NodeId& node, const std::string& status) {
    size_t n = 0;
    for (const auto& t : traces) {
        if (t.node_id == node && t.status == status) ++n;
    }
    return n;
}

// ModelClient that plays back queued responses and records every request
class ScriptedModel : public ModelClient {
public:
    void push(ChatResponse response) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(response));
    }

    void push_text(const std::string& content, const std::string& chat_id = "chat-1") {
        ChatResponse r;
        r.content = content;
        r.tokens = static_cast<int>(content.size());
        r.model = "scripted";
        r.chat_id = chat_id;
        push(std::move(r));
    }

    void push_tool_call(const std::string& name, Value arguments, const std::string& id = "tc-1") {
        ChatResponse r;
        r.tool_calls.push_back(ToolCallRequest{id, name, std::move(arguments)});
        r.finish_reason = "tool_calls";
        r.model = "scripted";
        r.chat_id = "chat-1";
        push(std::move(r));
    }

    ChatResponse chat(const ChatRequest& request, const TokenCallback& on_token) override {
        ChatResponse r;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            if (script_.empty()) {
                r.content = "(no more responses)";
                r.model = "scripted";
            } else {
                r = script_.front();
                script_.pop_front();
            }
        }
        if (on_token && !r.content.empty()) on_token(r.content);
        return r;
    }

    std::vector<ChatRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<ChatResponse> script_;
    std::vector<ChatRequest> requests_;
};

// Runs `fn` and returns the FlowError code it throws
template <typename Fn>
ErrorCode thrown_code(Fn&& fn) {
    try {
        fn();
    } catch (const FlowError& e) {
        return e.code();
    }
    FAIL("expected a FlowError");
    return ErrorCode::CALL_FAILURE;
}

} // namespace agentflow::testing

#endif // AGENTFLOW_TESTS_TEST_SUPPORT_H
