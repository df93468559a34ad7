// tests/test_chat_state.cpp
#include "agent/chat_tool.h"
#include "test_support.h"
#include <algorithm>

using namespace agentflow;
using agentflow::testing::ScriptedModel;
using agentflow::testing::TempDir;
using agentflow::testing::engine_from_yaml;
using agentflow::testing::quiet_config;
using agentflow::testing::thrown_code;

namespace {

struct ChatRun {
    std::unique_ptr<WorkflowEngine> engine;
    std::shared_ptr<ScriptedModel> model = std::make_shared<ScriptedModel>();
    std::shared_ptr<CollectingEventSink> sink = std::make_shared<CollectingEventSink>();

    explicit ChatRun(const std::string& yaml, EngineConfig config = quiet_config()) {
        engine = engine_from_yaml(yaml, std::move(config));
        engine->set_model_client(model);
        engine->set_event_sink(sink);
    }

    size_t content_events() const { return sink->events_of("content").size(); }
};

// Answers every tool_call through the engine's client bridge
class FrontendSink : public EventSink {
public:
    explicit FrontendSink(WorkflowEngine* engine) : engine_(engine) {}

    void emit(const Event& event) override {
        if (event.type != "tool_call") return;
        engine_->client_bridge()->resolve(event.data["id"].get<std::string>(),
                                          Value{{"executed_on_client", true}, {"result", "rendered"}});
    }

private:
    WorkflowEngine* engine_;
};

const char* const kAskThenRead = R"yaml(
nodes:
  ask:
    call: chat
    args: {message: "'hi'", state: "$input.state", stateless: "$input.stateless"}
  after:
    call: set_context
    args: {said: "default($reply.content, 'none')"}
edges: ["ask -> after"]
)yaml";

} // namespace

TEST_CASE("Chat states map to persistence and streaming", "[chat][state]") {
    SECTION("default is context_visible") {
        ChatMode mode = parse_chat_mode(Value::object());
        REQUIRE(mode.persist);
        REQUIRE(mode.stream);
    }
    SECTION("single states") {
        ChatMode hidden = parse_chat_mode(Value{{"state", "context_hidden"}});
        REQUIRE(hidden.persist);
        REQUIRE_FALSE(hidden.stream);

        ChatMode display = parse_chat_mode(Value{{"state", "display_only"}});
        REQUIRE_FALSE(display.persist);
        REQUIRE(display.stream);

        ChatMode silent = parse_chat_mode(Value{{"state", "silent"}});
        REQUIRE_FALSE(silent.persist);
        REQUIRE_FALSE(silent.stream);
    }
    SECTION("in:out takes persistence from the left and streaming from the right") {
        ChatMode mode = parse_chat_mode(Value{{"state", "context_hidden:display_only"}});
        REQUIRE(mode.input_state == "context_hidden");
        REQUIRE(mode.output_state == "display_only");
        REQUIRE(mode.persist);
        REQUIRE(mode.stream);

        ChatMode reverse = parse_chat_mode(Value{{"state", "display_only:silent"}});
        REQUIRE_FALSE(reverse.persist);
        REQUIRE_FALSE(reverse.stream);
    }
    SECTION("stateless wins over state") {
        ChatMode a = parse_chat_mode(Value{{"stateless", true}, {"state", "context_visible"}});
        REQUIRE_FALSE(a.persist);
        REQUIRE_FALSE(a.stream);
        ChatMode b = parse_chat_mode(Value{{"stateless", "true"}});
        REQUIRE(b.input_state == "silent");
        ChatMode c = parse_chat_mode(Value{{"stateless", false}});
        REQUIRE(c.persist);
    }
    SECTION("unknown states are rejected") {
        REQUIRE(thrown_code([] { parse_chat_mode(Value{{"state", "loud"}}); }) == ErrorCode::INVALID_ARGUMENT);
        REQUIRE(thrown_code([] { parse_chat_mode(Value{{"state", "silent:loud"}}); }) ==
                ErrorCode::INVALID_ARGUMENT);
    }
}

TEST_CASE("A visible call streams content and updates the reply", "[chat][state]") {
    ChatRun run(kAskThenRead);
    run.model->push_text("Hello there");

    RunResult result = run.engine->run(Value{{"state", "context_visible"}});
    REQUIRE(result.success);
    REQUIRE(run.content_events() == 1);
    REQUIRE(run.sink->events_of("content")[0].data["text"] == "Hello there");
    REQUIRE(result.final_context["said"] == "Hello there");
    REQUIRE(run.model->requests()[0].stream);
    REQUIRE(run.model->requests()[0].remember);
}

TEST_CASE("Silent and display-only calls leave the context alone", "[chat][state]") {
    ChatRun run(kAskThenRead);

    SECTION("stateless") {
        run.model->push_text("secret");
        RunResult result = run.engine->run(Value{{"stateless", true}});
        REQUIRE(result.success);
        REQUIRE(run.content_events() == 0);
        REQUIRE(result.final_context["said"] == "none");
        REQUIRE_FALSE(run.model->requests()[0].stream);
        // nothing to continue, so the backend must not keep the exchange
        REQUIRE_FALSE(run.model->requests()[0].remember);
    }
    SECTION("display_only") {
        run.model->push_text("shown");
        RunResult result = run.engine->run(Value{{"state", "display_only"}});
        REQUIRE(result.success);
        REQUIRE(run.content_events() == 1);
        REQUIRE(result.final_context["said"] == "none");
    }

    auto completes = run.sink->events_of("node_complete");
    auto ask = std::find_if(completes.begin(), completes.end(), [](const Event& e) { return e.node == "ask"; });
    REQUIRE(ask != completes.end());
    REQUIRE(ask->data["persist"] == false);
    REQUIRE_FALSE(ask->data.contains("output"));
}

TEST_CASE("Hidden calls update the context but stay off the event stream", "[chat][state]") {
    ChatRun run(kAskThenRead);
    run.model->push_text("internal notes");

    RunResult result = run.engine->run(Value{{"state", "context_hidden"}});
    REQUIRE(result.success);
    REQUIRE(run.content_events() == 0);
    REQUIRE(result.final_context["said"] == "internal notes");

    auto completes = run.sink->events_of("node_complete");
    auto ask = std::find_if(completes.begin(), completes.end(), [](const Event& e) { return e.node == "ask"; });
    REQUIRE(ask != completes.end());
    REQUIRE(ask->data["persist"] == true);
    REQUIRE(ask->data["stream"] == false);
    REQUIRE_FALSE(ask->data.contains("output"));
    for (const auto& event : run.sink->events()) {
        if (event.node != "ask") continue;
        REQUIRE(event.data.dump().find("internal notes") == std::string::npos);
    }
}

TEST_CASE("Reply fields are readable from later nodes", "[chat][reply]") {
    ChatRun run(R"(
nodes:
  ask: {call: chat, args: {message: "'hi'", model: "'local-7b'"}}
  after:
    call: set_context
    args: {content: "$reply.content", tokens: "$reply.tokens", model: "$reply.model",
           finish: "$reply.finish_reason", chat: "$reply.chat_id", out: "$ask.output"}
edges: ["ask -> after"]
)");
    run.model->push_text("four", "conv-1");

    RunResult result = run.engine->run();
    REQUIRE(result.success);
    const Value& ctx = result.final_context;
    REQUIRE(ctx["content"] == "four");
    REQUIRE(ctx["tokens"] == 4);
    REQUIRE(ctx["model"] == "scripted");
    REQUIRE(ctx["finish"] == "stop");
    REQUIRE(ctx["chat"] == "conv-1");
    REQUIRE(ctx["out"] == "four");
    REQUIRE(run.model->requests()[0].model == "local-7b");
}

TEST_CASE("Conversations continue through reply.chat_id", "[chat][reply]") {
    ChatRun run(R"(
nodes:
  first: {call: chat, args: {message: "'one'"}}
  second: {call: chat, args: {message: "'two'"}}
  aside: {call: chat, args: {message: "'three'", chat_id: "'side-thread'"}}
  quiet: {call: chat, args: {message: "'four'", stateless: true}}
edges: ["first -> second -> aside -> quiet"]
)");
    run.model->push_text("a", "conv-9");
    run.model->push_text("b", "conv-9");
    run.model->push_text("c", "side-thread");
    run.model->push_text("d", "other");

    RunResult result = run.engine->run();
    REQUIRE(result.success);
    auto requests = run.model->requests();
    REQUIRE(requests.size() == 4);
    REQUIRE_FALSE(requests[0].chat_id.has_value());
    REQUIRE(requests[1].chat_id == std::optional<std::string>("conv-9"));
    REQUIRE(requests[2].chat_id == std::optional<std::string>("side-thread"));
    // non-persisting calls start fresh
    REQUIRE_FALSE(requests[3].chat_id.has_value());
}

TEST_CASE("Tool calls loop back to the model until it answers", "[chat][tools]") {
    ChatRun run(R"(
exit: [ask]
nodes:
  ask:
    call: chat
    args:
      message: "'what is the price?'"
      tools: [{name: lookup, description: "'Look up a price'"}]
)");
    int lookups = 0;
    run.engine->register_tool(
        "lookup",
        [&lookups](const Value& args, ToolCallContext&) {
            ++lookups;
            return Value{{"price", args["key"].get<std::string>() == "apple" ? 3 : 0}};
        },
        {"key"});

    SECTION("one call then an answer") {
        run.model->push_tool_call("lookup", Value{{"key", "apple"}}, "tc-1");
        run.model->push_text("It costs 3.");

        RunResult result = run.engine->run();
        REQUIRE(result.success);
        REQUIRE(result.output == "It costs 3.");
        REQUIRE(lookups == 1);

        auto requests = run.model->requests();
        REQUIRE(requests.size() == 2);
        REQUIRE(requests[0].tools.size() == 1);
        REQUIRE(tool_definition_name(requests[0].tools[0]) == "lookup");
        REQUIRE(requests[0].messages[0].role == "user");
        REQUIRE(requests[1].messages.size() == 1);
        REQUIRE(requests[1].messages[0].role == "tool");
        REQUIRE(requests[1].messages[0].tool_call_id == "tc-1");
        REQUIRE(Value::parse(requests[1].messages[0].content)["price"] == 3);
    }
    SECTION("identical calls in one turn run once") {
        ChatResponse twice;
        twice.tool_calls.push_back(ToolCallRequest{"tc-1", "lookup", Value{{"key", "apple"}}});
        twice.tool_calls.push_back(ToolCallRequest{"tc-2", "lookup", Value{{"key", "apple"}}});
        twice.finish_reason = "tool_calls";
        run.model->push(twice);
        run.model->push_text("done");

        RunResult result = run.engine->run();
        REQUIRE(result.success);
        REQUIRE(lookups == 1);
        auto second = run.model->requests()[1];
        REQUIRE(second.messages.size() == 2);
        REQUIRE(second.messages[0].content == second.messages[1].content);
        REQUIRE(second.messages[1].tool_call_id == "tc-2");
    }
    SECTION("tool errors are fed back to the model") {
        run.model->push_tool_call("missing_tool", Value::object());
        run.model->push_tool_call("lookup", Value::object(), "tc-2");
        run.model->push_text("sorry");

        RunResult result = run.engine->run();
        REQUIRE(result.success);
        REQUIRE(result.output == "sorry");
        auto requests = run.model->requests();
        REQUIRE(requests.size() == 3);
        REQUIRE(requests[1].messages[0].content.rfind("Error: ", 0) == 0);
        // missing required argument
        REQUIRE(requests[2].messages[0].content.rfind("Error: ", 0) == 0);
        REQUIRE(lookups == 0);
    }
}

TEST_CASE("Agents that keep calling tools exhaust max_tool_turns", "[chat][tools][budget]") {
    EngineConfig config = quiet_config();
    config.limits.max_tool_turns = 2;
    ChatRun run("nodes:\n  ask: {call: chat, args: {message: \"'loop'\"}}\n", config);
    run.engine->register_tool("noop", [](const Value&, ToolCallContext&) { return Value("ok"); });
    for (int i = 0; i < 3; ++i) run.model->push_tool_call("noop", Value{{"i", i}});

    RunResult result = run.engine->run();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error->code == ErrorCode::BUDGET_EXCEEDED);
    REQUIRE(result.error->node == "ask");
    REQUIRE(run.model->requests().size() == 2);
}

TEST_CASE("Client-executed tools end the agent call", "[chat][tools][bridge]") {
    auto engine = engine_from_yaml(R"(
nodes:
  ask: {call: chat, args: {message: "'show a chart'"}}
  after: {call: set_context, args: {finish: "$reply.finish_reason", out: "$ask.output"}}
edges: ["ask -> after"]
)");
    auto model = std::make_shared<ScriptedModel>();
    engine->set_model_client(model);
    engine->enable_client_bridge(std::chrono::seconds(5));
    engine->set_event_sink(std::make_shared<FrontendSink>(engine.get()));
    model->push_tool_call("ui.chart", Value{{"series", Value::array({1, 2})}});

    RunResult result = engine->run();
    REQUIRE(result.success);
    REQUIRE(result.final_context["out"] == "Client tools executed on frontend.");
    REQUIRE(result.final_context["finish"] == "client_tool");
    REQUIRE(model->requests().size() == 1);
}

TEST_CASE("format=json parses the reply", "[chat]") {
    ChatRun run("exit: [ask]\nnodes:\n  ask: {call: chat, args: {message: \"'rate it'\", format: \"'json'\"}}\n");

    SECTION("fenced JSON") {
        run.model->push_text("Here you go:\n```json\n{\"score\": 3}\n```");
        RunResult result = run.engine->run();
        REQUIRE(result.output == Value{{"score", 3}});
    }
    SECTION("prose stays text") {
        run.model->push_text("no idea");
        RunResult result = run.engine->run();
        REQUIRE(result.success);
        REQUIRE(result.output == "no idea");
    }
}

TEST_CASE("Agent settings shape the model request", "[chat][agents]") {
    ChatRun run("nodes:\n  ask: {call: chat, args: {message: \"'hi'\", agent: \"'helper'\"}}\n");
    run.engine->tool_registry().register_bundle(
        ToolResource{"ops", "Ops", "", Value::array({Value{{"name", "restart"}}})});
    run.engine->agent_registry().register_agent(AgentRegistry::from_value(
        Value{{"slug", "helper"},
              {"model", "local-7b"},
              {"temperature", 0.1},
              {"system_prompt", "You help {{ input.user }}."},
              {"tools", "@ops"}},
        "helper.yaml"));
    run.model->push_text("hello");

    RunResult result = run.engine->run(Value{{"user", "Ann"}});
    REQUIRE(result.success);
    ChatRequest request = run.model->requests()[0];
    REQUIRE(request.model == "local-7b");
    REQUIRE(request.temperature == 0.1);
    REQUIRE(request.system_prompt == "You help Ann.");
    REQUIRE(tool_definition_name(request.tools[0]) == "restart");
}

TEST_CASE("Agents with a workflow run it as a sub-workflow", "[chat][agents][workflow]") {
    TempDir dir;
    dir.write("agents/reviewer.yaml", "slug: reviewer\nworkflow: ../flows/review.yaml\nreturns: [verdict]\n");
    dir.write("flows/review.yaml", R"(
nodes:
  judge:
    call: set_context
    args: {verdict: "$input.message + ' looks fine'", who: "$input.agent"}
)");
    dir.write("main.yaml", R"(
agents: ["agents/*.yaml"]
exit: [ask]
nodes:
  ask: {call: chat, args: {message: "'the patch'", agent: "'reviewer'"}}
)");

    auto engine = std::make_unique<WorkflowEngine>(quiet_config());
    engine->load(dir.path("main.yaml"));
    RunResult result = engine->run();

    REQUIRE(result.success);
    REQUIRE(result.output["verdict"] == "the patch looks fine");
    REQUIRE(result.output["who"] == "reviewer");
    REQUIRE(result.final_context["verdict"] == "the patch looks fine");
    // only declared returns reach the caller
    REQUIRE_FALSE(result.final_context.contains("who"));
}

TEST_CASE("A workflow that calls itself hits the recursion limit", "[chat][workflow]") {
    TempDir dir;
    dir.write("again.yaml", "nodes:\n  again: {call: workflow, args: {path: \"'again.yaml'\"}}\n");

    auto engine = std::make_unique<WorkflowEngine>(quiet_config());
    engine->load(dir.path("again.yaml"));
    RunResult result = engine->run();

    REQUIRE_FALSE(result.success);
    REQUIRE(result.error->code == ErrorCode::RECURSION_LIMIT);
    REQUIRE(result.error->node == "again");
}

TEST_CASE("Chat without an agent or model fails resolution", "[chat]") {
    SECTION("unknown agent") {
        ChatRun run("nodes:\n  ask: {call: chat, args: {message: \"'hi'\", agent: \"'ghost'\"}}\n");
        RunResult result = run.engine->run();
        REQUIRE(result.error->code == ErrorCode::TOOL_RESOLUTION_ERROR);
        REQUIRE(result.error->details["agent"] == "ghost");
    }
    SECTION("no model client") {
        RunResult result = agentflow::testing::run_yaml("nodes:\n  ask: {call: chat, args: {message: \"'hi'\"}}\n");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error->code == ErrorCode::TOOL_RESOLUTION_ERROR);
    }
    SECTION("message is required") {
        ChatRun run("nodes:\n  ask: {call: chat, args: {}}\n");
        RunResult result = run.engine->run();
        REQUIRE(result.error->code == ErrorCode::MISSING_ARGUMENT);
    }
}
