// agentflow/core/engine.h
#ifndef AGENTFLOW_CORE_ENGINE_H
#define AGENTFLOW_CORE_ENGINE_H

#include "agent/agent_registry.h"
#include "agent/prompt_registry.h"
#include "common/config/engine_config.h"
#include "common/llm/model_client.h"
#include "core/types/event.h"
#include "core/types/node.h"
#include "core/types/result.h"
#include "scheduler/cancellation.h"
#include "tools/builtin_registry.h"
#include "tools/client_bridge.h"
#include "tools/tool_dispatcher.h"
#include "tools/tool_registry.h"
#include "tools/tool_server.h"
#include "trace/trace_exporter.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

// Compiles a workflow (merge + validation + resources) and runs it.
//
//   auto engine = WorkflowEngine::from_file("flows/main.yaml");
//   engine->set_event_sink(std::make_shared<JsonLinesEventSink>(std::cout));
//   RunResult result = engine->run({{"message", "hi"}});
//
// One run at a time per engine; runs are independent and reuse the compiled graph.
class WorkflowEngine {
public:
    explicit WorkflowEngine(EngineConfig config = EngineConfig());
    ~WorkflowEngine();

    WorkflowEngine(const WorkflowEngine&) = delete;
    WorkflowEngine& operator=(const WorkflowEngine&) = delete;

    // Config is read from `config_path` (defaults apply when it is missing).
    // throws ParseError, CircularImport, GraphError
    static std::unique_ptr<WorkflowEngine> from_file(const std::string& workflow_path,
                                                     const std::string& config_path = "agentflow.json");

    // throws ParseError, CircularImport, GraphError
    void load(const std::string& root_path);
    void load_graph(WorkflowGraph graph, const std::string& base_dir = ".");
    bool loaded() const { return graph_ != nullptr; }
    const WorkflowGraph& graph() const;

    RunResult run(const Value& input = Value::object());
    // Thread-safe; the active run fails with Cancelled
    void cancel(const std::string& reason = "cancelled by caller");

    void set_model_client(std::shared_ptr<ModelClient> model) { model_ = std::move(model); }
    void set_event_sink(std::shared_ptr<EventSink> sink) { sink_ = std::move(sink); }
    void add_tool_server(const std::string& tool_namespace, std::shared_ptr<ToolServerClient> server) {
        servers_.add_server(tool_namespace, std::move(server));
    }

    template <typename Func>
    void register_tool(std::string name, Func&& func, std::vector<std::string> required = {}) {
        builtins_.register_tool(std::move(name), std::forward<Func>(func), std::move(required));
    }
    void register_tool(std::unique_ptr<BuiltinTool> tool) { builtins_.register_tool(std::move(tool)); }

    void enable_client_bridge(std::chrono::milliseconds timeout);
    // null unless the client bridge is enabled
    ClientBridge* client_bridge() { return bridge_.get(); }

    ToolRegistry& tool_registry() { return tools_; }
    AgentRegistry& agent_registry() { return agents_; }
    PromptRegistry& prompt_registry() { return prompts_; }
    const EngineConfig& config() const { return config_; }

    std::vector<TraceRecord> get_last_traces() const;

private:
    void start_tool_servers();
    void load_resources(const std::vector<ResourcePattern>& patterns);
    RunResult run_subworkflow(const SubWorkflowRequest& request, ToolCallContext& tc);
    std::shared_ptr<const WorkflowGraph> load_subgraph(const std::string& path);
    std::string resolve_workflow_path(const std::string& ref);

    EngineConfig config_;
    BuiltinRegistry builtins_;
    ToolRegistry tools_;
    ToolServerRegistry servers_;
    std::unique_ptr<ClientBridge> bridge_;
    ToolDispatcher dispatcher_;
    AgentRegistry agents_;
    PromptRegistry prompts_;
    std::shared_ptr<ModelClient> model_;
    std::shared_ptr<EventSink> sink_;

    std::shared_ptr<const WorkflowGraph> graph_;
    std::string base_dir_ = ".";
    std::unordered_map<std::string, std::string> modules_; // slug -> workflow path

    std::mutex subgraph_mutex_; // guards modules_ and subgraphs_
    std::unordered_map<std::string, std::shared_ptr<const WorkflowGraph>> subgraphs_;

    std::mutex run_mutex_; // serializes run()
    mutable std::mutex state_mutex_;
    CancellationToken active_cancel_;
    std::vector<TraceRecord> last_traces_;
    int run_count_ = 0;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_ENGINE_H
