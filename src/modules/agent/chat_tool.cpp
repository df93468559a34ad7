// modules/agent/chat_tool.cpp
#include "agent/chat_tool.h"
#include "agent/prompt_registry.h"
#include "budget/budget_controller.h"
#include "common/llm/model_client.h"
#include "common/utils/logger.h"
#include "common/utils/template_renderer.h"
#include "tools/tool_dispatcher.h"
#include "tools/tool_registry.h"
#include <unordered_map>

namespace agentflow {

namespace {

const char* const kClientToolsDone = "Client tools executed on frontend.";

bool state_persists(const std::string& state) {
    return state == "context_visible" || state == "context_hidden";
}

bool state_streams(const std::string& state) {
    return state == "context_visible" || state == "display_only";
}

bool has_arg(const Value& args, const char* key) {
    return args.is_object() && args.contains(key) && !args[key].is_null();
}

std::string text_arg(const Value& args, const char* key) {
    return has_arg(args, key) ? value::to_display(args[key]) : "";
}

// strips ```json fences and surrounding prose
Value parse_json_reply(const std::string& text) {
    std::string body = text;
    auto fence = body.find("```");
    if (fence != std::string::npos) {
        auto start = body.find('\n', fence);
        auto end = body.find("```", start == std::string::npos ? fence + 3 : start);
        if (start != std::string::npos && end != std::string::npos) body = body.substr(start + 1, end - start - 1);
    }
    auto first = body.find_first_of("[{");
    auto last = body.find_last_of("]}");
    if (first != std::string::npos && last != std::string::npos && last > first) {
        body = body.substr(first, last - first + 1);
    }
    try {
        return Value::parse(body);
    } catch (const Value::parse_error&) {
        log_warning("format=json requested but the reply is not JSON");
        return text;
    }
}

} // namespace

bool is_known_chat_state(const std::string& state) {
    return state == "context_visible" || state == "context_hidden" || state == "display_only" || state == "silent";
}

ChatMode parse_chat_mode(const Value& args) {
    ChatMode mode;
    if (has_arg(args, "stateless")) {
        const Value& s = args["stateless"];
        bool stateless = s.is_string() ? s.get<std::string>() == "true" : value::truthy(s);
        if (stateless) {
            mode.input_state = mode.output_state = "silent";
            mode.persist = mode.stream = false;
            return mode;
        }
    }
    if (has_arg(args, "state")) {
        std::string raw = value::to_display(args["state"]);
        auto colon = raw.find(':');
        mode.input_state = colon == std::string::npos ? raw : raw.substr(0, colon);
        mode.output_state = colon == std::string::npos ? raw : raw.substr(colon + 1);
        for (const auto* state : {&mode.input_state, &mode.output_state}) {
            if (!is_known_chat_state(*state)) {
                throw FlowError(ErrorCode::INVALID_ARGUMENT, "Unknown chat state: " + *state, {},
                                Value{{"state", raw}});
            }
        }
    }
    mode.persist = state_persists(mode.input_state);
    mode.stream = state_streams(mode.output_state);
    return mode;
}

ToolOutcome ChatTool::call(const Value& args, ToolCallContext& tc) {
    ChatMode mode;
    try {
        mode = parse_chat_mode(args);
    } catch (const FlowError& e) {
        throw e.at_node(tc.node);
    }

    std::optional<AgentResource> agent;
    std::string slug = text_arg(args, "agent");
    if (!slug.empty()) {
        if (tc.services.agents) agent = tc.services.agents->find(slug);
        if (!agent) {
            throw FlowError(ErrorCode::TOOL_RESOLUTION_ERROR, "Unknown agent: " + slug, tc.node,
                            Value{{"agent", slug}});
        }
    }
    log_debug("[" + tc.node + "] chat agent=" + (slug.empty() ? "default" : slug) + " state=" + mode.input_state +
              ":" + mode.output_state);

    Value output = agent && agent->has_workflow() ? run_agent_workflow(*agent, args["message"], mode, tc)
                                                  : run_model_loop(agent ? &*agent : nullptr, args, mode, tc);
    return ToolOutcome{std::move(output), mode.persist, mode.stream};
}

Value ChatTool::run_agent_workflow(const AgentResource& agent, const Value& message, const ChatMode& mode,
                                   ToolCallContext& tc) const {
    if (!tc.services.run_subworkflow) {
        throw FlowError(ErrorCode::TOOL_RESOLUTION_ERROR, "Agent workflows are not available", tc.node);
    }
    SubWorkflowRequest request;
    request.identifier = "agent:" + agent.workflow;
    request.path = agent.workflow;
    request.input = Value{{"message", message}, {"agent", agent.slug}};
    request.returns = agent.returns;

    log_info("[" + tc.node + "] agent '" + agent.slug + "' runs " + agent.workflow);
    RunResult result = tc.services.run_subworkflow(request, tc);
    if (!result.success) {
        ErrorInfo inner = result.error.value_or(ErrorInfo{ErrorCode::CALL_FAILURE, result.message, {}, nullptr});
        throw FlowError(inner.code, "Agent '" + agent.slug + "' workflow failed: " + inner.message, tc.node,
                        Value{{"agent", agent.slug}, {"workflow", agent.workflow}, {"error", inner.to_value()}});
    }

    if (mode.stream && !result.output.is_null()) {
        tc.events.emit("content", tc.node, Value{{"text", value::to_display(result.output)}});
    }
    if (mode.persist) {
        Value reply = tc.context.reply();
        reply["content"] = value::to_display(result.output);
        reply["model"] = agent.model;
        reply["finish_reason"] = "stop";
        tc.context.set_reply(reply);
    }
    return result.output;
}

std::string ChatTool::system_prompt(const AgentResource* agent, const Value& args, ToolCallContext& tc) const {
    Value data = {{"ctx", tc.context.ctx()}, {"input", tc.context.input()}};
    if (has_arg(args, "system_prompt")) return text_arg(args, "system_prompt");
    if (!agent) return "";
    if (!agent->system_prompt_slug.empty()) {
        if (tc.services.prompts && tc.services.prompts->has_prompt(agent->system_prompt_slug)) {
            return tc.services.prompts->render(agent->system_prompt_slug, data);
        }
        log_warning("Prompt '" + agent->system_prompt_slug + "' linked by agent '" + agent->slug + "' not found");
    }
    if (agent->system_prompt.find("{{") == std::string::npos) return agent->system_prompt;
    return InjaTemplateRenderer::render(agent->system_prompt, data);
}

Value ChatTool::run_model_loop(const AgentResource* agent, const Value& args, const ChatMode& mode,
                               ToolCallContext& tc) const {
    RunServices& services = tc.services;
    if (!services.model) {
        throw FlowError(ErrorCode::TOOL_RESOLUTION_ERROR, "chat(): no model client configured", tc.node);
    }
    if (!services.dispatcher) throw FlowError(ErrorCode::TOOL_RESOLUTION_ERROR, "chat(): no tool dispatcher", tc.node);

    ChatRequest request;
    request.model = has_arg(args, "model") ? text_arg(args, "model") : (agent ? agent->model : "");
    request.temperature = has_arg(args, "temperature") ? value::to_number(args["temperature"])
                                                       : (agent ? agent->temperature : 0.7);
    request.system_prompt = system_prompt(agent, args, tc);
    request.stream = mode.stream;
    request.remember = mode.persist;

    Value call_tools = has_arg(args, "tools") ? args["tools"] : Value(nullptr);
    Value agent_tools = agent ? agent->tools : Value(nullptr);
    if (!call_tools.is_null() || !agent_tools.is_null()) {
        if (!services.tools) throw FlowError(ErrorCode::TOOL_RESOLUTION_ERROR, "No tool registry", tc.node);
        try {
            request.tools = services.tools->resolve_tools(call_tools, agent_tools);
        } catch (const FlowError& e) {
            throw e.at_node(tc.node);
        }
    }

    // explicit chat_id > inherited reply.chat_id (persisting calls only) > fresh conversation
    std::string chat_id = text_arg(args, "chat_id");
    if (chat_id.empty() && mode.persist) {
        Value reply = tc.context.reply();
        if (reply.contains("chat_id") && reply["chat_id"].is_string()) chat_id = reply["chat_id"].get<std::string>();
    }
    if (!chat_id.empty()) request.chat_id = chat_id;

    request.messages.push_back(ChatMessage{"user", value::to_display(args["message"]), {}, {}});

    TokenCallback on_token;
    if (mode.stream) {
        on_token = [&tc](const std::string& piece) { tc.events.emit("content", tc.node, Value{{"text", piece}}); };
    }

    const int max_turns = services.budget ? services.budget->max_tool_turns() : 10;
    int tokens = 0;
    for (int turn = 0;; ++turn) {
        services.cancel.throw_if_cancelled(tc.node);
        if (turn >= max_turns) {
            throw FlowError(ErrorCode::BUDGET_EXCEEDED,
                            "Agent still calling tools after " + std::to_string(max_turns) + " turns", tc.node,
                            Value{{"max_tool_turns", max_turns}});
        }
        if (services.budget) services.budget->consume_model_call(tc.node);

        ChatResponse response = services.model->chat(request, on_token);
        tokens += response.tokens;
        if (!response.chat_id.empty()) request.chat_id = response.chat_id;

        bool terminal = false;
        std::string content = response.content;
        if (response.has_tool_calls()) {
            std::vector<ChatMessage> results;
            // identical name+arguments within one turn run once
            std::unordered_map<std::string, std::string> seen;
            for (const auto& call : response.tool_calls) {
                std::string key = call.name + ":" + call.arguments.dump();
                auto hit = seen.find(key);
                if (hit == seen.end()) {
                    std::string text;
                    try {
                        DispatchResult dispatched = services.dispatcher->dispatch(call.name, call.arguments, tc);
                        terminal = terminal || dispatched.executed_on_client;
                        text = value::to_display(dispatched.value);
                    } catch (const FlowError& e) {
                        if (e.code() == ErrorCode::CANCELLED || e.code() == ErrorCode::BUDGET_EXCEEDED) throw;
                        log_warning("[" + tc.node + "] tool " + call.name + " failed: " + e.what());
                        text = std::string("Error: ") + e.what();
                    }
                    hit = seen.emplace(key, std::move(text)).first;
                }
                results.push_back(ChatMessage{"tool", hit->second, {}, call.id});
            }
            if (!terminal) {
                request.messages = std::move(results);
                continue;
            }
            content = kClientToolsDone;
        }

        Value output = text_arg(args, "format") == "json" ? parse_json_reply(content) : Value(content);
        if (mode.persist) {
            Value reply = tc.context.reply();
            reply["content"] = content;
            reply["tokens"] = tokens;
            reply["model"] = response.model.empty() ? request.model : response.model;
            reply["finish_reason"] = terminal ? "client_tool" : response.finish_reason;
            reply["chat_id"] = request.chat_id.value_or("");
            tc.context.set_reply(reply);
        }
        return output;
    }
}

void register_chat_builtin(BuiltinRegistry& registry) {
    registry.register_tool(std::make_unique<ChatTool>());
}

} // namespace agentflow
