// src/core/engine.cpp
#include "agentflow/core/engine.h"
#include "agent/chat_tool.h"
#include "budget/budget_controller.h"
#include "common/llm/llama_adapter.h"
#include "common/utils/logger.h"
#include "common/utils/path_utils.h"
#include "graph/graph_merger.h"
#include "scheduler/topo_scheduler.h"
#include "tools/stdio_transport.h"
#include <filesystem>

namespace agentflow {

WorkflowEngine::WorkflowEngine(EngineConfig config) : config_(std::move(config)) {
    set_log_level(parse_log_level(config_.log_level));

    register_system_builtins(builtins_);
    register_devtools(builtins_);
    register_network_builtins(builtins_);
    register_prompt_builtin(builtins_);
    register_chat_builtin(builtins_);

    if (config_.client_bridge_enabled) {
        enable_client_bridge(std::chrono::seconds(config_.client_bridge_timeout_sec));
    }
    if (config_.model_enabled) {
        auto model = std::make_shared<LlamaChatModel>(config_.model);
        if (model->is_loaded()) {
            model_ = std::move(model);
        } else {
            log_warning("Model could not be loaded: " + config_.model.model_path);
        }
    }
    start_tool_servers();
}

WorkflowEngine::~WorkflowEngine() {
    cancel("engine shutting down");
}

std::unique_ptr<WorkflowEngine> WorkflowEngine::from_file(const std::string& workflow_path,
                                                          const std::string& config_path) {
    auto engine = std::make_unique<WorkflowEngine>(load_engine_config(config_path));
    engine->load(workflow_path);
    return engine;
}

void WorkflowEngine::start_tool_servers() {
    for (const auto& server : config_.tool_servers) {
        try {
            auto transport = std::make_unique<StdioTransport>(server.command, server.env);
            servers_.add_server(server.tool_namespace(),
                                std::make_shared<JsonRpcToolServer>(server.name, std::move(transport)));
            log_info("Tool server '" + server.name + "' registered as '" + server.tool_namespace() + "'");
        } catch (const FlowError& e) {
            log_error("Tool server '" + server.name + "' not started: " + e.what());
        }
    }
}

void WorkflowEngine::enable_client_bridge(std::chrono::milliseconds timeout) {
    bridge_ = std::make_unique<ClientBridge>(timeout);
}

void WorkflowEngine::load(const std::string& root_path) {
    GraphMerger merger;
    WorkflowGraph graph = merger.merge(root_path);
    base_dir_ = parent_dir(root_path);
    load_resources(graph.resources);
    graph_ = std::make_shared<const WorkflowGraph>(std::move(graph));
    log_info("Loaded workflow '" + graph_->name + "' (" + std::to_string(graph_->nodes.size()) + " nodes)");
}

void WorkflowEngine::load_graph(WorkflowGraph graph, const std::string& base_dir) {
    GraphMerger merger;
    WorkflowGraph merged = merger.merge(std::move(graph), base_dir);
    base_dir_ = base_dir;
    load_resources(merged.resources);
    graph_ = std::make_shared<const WorkflowGraph>(std::move(merged));
}

const WorkflowGraph& WorkflowEngine::graph() const {
    if (!graph_) throw FlowError(ErrorCode::GRAPH_ERROR, "No workflow loaded");
    return *graph_;
}

void WorkflowEngine::load_resources(const std::vector<ResourcePattern>& patterns) {
    for (const auto& pattern : patterns) {
        auto files = expand_glob(pattern.pattern);
        if (files.empty()) {
            log_warning("No " + to_string(pattern.kind) + " match " + pattern.pattern);
            continue;
        }
        for (const auto& file : files) {
            switch (pattern.kind) {
            case ResourceKind::PROMPT: prompts_.load_file(file); break;
            case ResourceKind::AGENT: agents_.load_file(file); break;
            case ResourceKind::TOOL: tools_.load_bundle_file(file); break;
            case ResourceKind::MODULE: {
                std::lock_guard<std::mutex> lock(subgraph_mutex_);
                modules_[file_stem(file)] = file;
                break;
            }
            }
            log_debug("Loaded " + to_string(pattern.kind) + ": " + file);
        }
    }
}

RunResult WorkflowEngine::run(const Value& input) {
    std::lock_guard<std::mutex> run_lock(run_mutex_);
    if (!graph_) {
        return RunResult::failed(ErrorInfo{ErrorCode::GRAPH_ERROR, "No workflow loaded", {}, nullptr},
                                 Value::object());
    }

    CancellationToken cancel;
    int run_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        active_cancel_ = cancel;
        run_id = ++run_count_;
    }

    BudgetController budget(config_.limits);
    EventChannel events(sink_);
    TraceExporter traces("run-" + std::to_string(run_id));

    RunServices services;
    services.builtins = &builtins_;
    services.tools = &tools_;
    services.servers = &servers_;
    services.bridge = bridge_.get();
    services.dispatcher = &dispatcher_;
    services.agents = &agents_;
    services.prompts = &prompts_;
    services.model = model_;
    services.budget = &budget;
    services.cancel = cancel;
    services.run_subworkflow = [this](const SubWorkflowRequest& request, ToolCallContext& tc) {
        return run_subworkflow(request, tc);
    };

    ExecutionContext context(input.is_null() ? Value::object() : input);
    TopoScheduler::Config scheduler_config;
    scheduler_config.max_parallel = config_.max_parallel;
    TopoScheduler scheduler(scheduler_config, services, events, traces);

    RunResult result;
    try {
        Value output = scheduler.run(*graph_, context);
        result = RunResult::ok(std::move(output), context.ctx());
    } catch (const FlowError& e) {
        result = RunResult::failed(e.info(), context.ctx());
    }

    Value done = {{"success", result.success}, {"message", result.message}};
    if (result.success) {
        done["output"] = result.output;
    } else {
        done["error"] = result.error->to_value();
    }
    events.emit("done", "", std::move(done));

    std::lock_guard<std::mutex> lock(state_mutex_);
    last_traces_ = traces.get_traces();
    return result;
}

void WorkflowEngine::cancel(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        active_cancel_.cancel(reason);
    }
    if (bridge_) bridge_->cancel_all(reason);
}

std::vector<TraceRecord> WorkflowEngine::get_last_traces() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_traces_;
}

std::string WorkflowEngine::resolve_workflow_path(const std::string& ref) {
    {
        std::lock_guard<std::mutex> lock(subgraph_mutex_);
        auto module = modules_.find(ref);
        if (module != modules_.end()) return module->second;
    }
    if (std::filesystem::exists(ref)) return ref;
    return resolve_path(base_dir_, ref);
}

std::shared_ptr<const WorkflowGraph> WorkflowEngine::load_subgraph(const std::string& path) {
    std::string key = canonical_key(path);
    {
        std::lock_guard<std::mutex> lock(subgraph_mutex_);
        auto it = subgraphs_.find(key);
        if (it != subgraphs_.end()) return it->second;
    }

    GraphMerger merger;
    auto graph = std::make_shared<const WorkflowGraph>(merger.merge(path));
    load_resources(graph->resources);

    std::lock_guard<std::mutex> lock(subgraph_mutex_);
    return subgraphs_.emplace(key, std::move(graph)).first->second;
}

RunResult WorkflowEngine::run_subworkflow(const SubWorkflowRequest& request, ToolCallContext& tc) {
    std::string path = resolve_workflow_path(request.path);
    const int max_depth = tc.services.budget ? tc.services.budget->max_call_depth() : 10;

    ExecutionContext child(request.input);
    child.inherit_execution_stack(tc.context.execution_stack());
    // throws RecursionLimit
    ExecutionGuard guard(child, request.identifier, max_depth);

    std::shared_ptr<const WorkflowGraph> graph;
    try {
        graph = load_subgraph(path);
    } catch (const FlowError& e) {
        throw e.at_node(tc.node);
    }

    log_debug("[" + tc.node + "] sub-workflow " + request.identifier + " (depth " +
              std::to_string(child.execution_stack().size()) + ")");

    TraceExporter traces("sub-" + request.identifier);
    TopoScheduler::Config scheduler_config;
    scheduler_config.max_parallel = config_.max_parallel;
    TopoScheduler scheduler(scheduler_config, tc.services, tc.events, traces);

    try {
        Value output = scheduler.run(*graph, child);
        for (const auto& key : request.returns) {
            if (child.has_key(key.substr(0, key.find('.')))) tc.context.set(key, child.get(key));
        }
        return RunResult::ok(std::move(output), child.ctx());
    } catch (const FlowError& e) {
        return RunResult::failed(e.info(), child.ctx());
    }
}

} // namespace agentflow
