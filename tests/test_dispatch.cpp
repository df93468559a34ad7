// tests/test_dispatch.cpp
#include "test_support.h"
#include "tools/stdio_transport.h"
#include <atomic>
#include <thread>

using namespace agentflow;
using agentflow::testing::engine_from_yaml;
using agentflow::testing::thrown_code;

namespace {

// Records events and answers tool_call events through `on_tool_call`
class ScriptedClient : public EventSink {
public:
    std::function<void(const Event&)> on_tool_call;

    void emit(const Event& event) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }
        if (event.type == "tool_call" && on_tool_call) on_tool_call(event);
    }

    size_t count(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) n += e.type == type ? 1 : 0;
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

class FakeServer : public ToolServerClient {
public:
    std::atomic<int> calls{0};
    std::string last_tool;
    Value last_args;

    Value list_tools() override {
        return Value::array({normalize_tool_definition(Value{{"name", "restart"}})});
    }
    Value call_tool(const std::string& name, const Value& args) override {
        ++calls;
        last_tool = name;
        last_args = args;
        if (name == "explode") throw FlowError(ErrorCode::CALL_FAILURE, "server says no");
        return Value{{"restarted", args.value("service", "")}};
    }
};

// Everything a dispatch needs, without an engine
struct DispatchHarness {
    BuiltinRegistry builtins;
    ToolServerRegistry servers;
    ToolDispatcher dispatcher;
    std::unique_ptr<ClientBridge> bridge;
    std::shared_ptr<ScriptedClient> client = std::make_shared<ScriptedClient>();
    EventChannel events{client};
    ExecutionContext context;
    LoopScopes scopes;
    RunServices services;

    DispatchHarness() {
        services.builtins = &builtins;
        services.servers = &servers;
        services.dispatcher = &dispatcher;
    }

    DispatchResult dispatch(const std::string& target, const Value& args) {
        services.bridge = bridge.get();
        ToolCallContext tc{"caller", context, scopes, events, services};
        return dispatcher.dispatch(target, args, tc);
    }
};

// JSON-RPC peer answering from a table
class FakeTransport : public JsonRpcTransport {
public:
    explicit FakeTransport(std::vector<Value>* log) : log_(log) {}

    Value request(const Value& message) override {
        log_->push_back(message);
        const std::string method = message["method"].get<std::string>();
        Value response = {{"jsonrpc", "2.0"}, {"id", message["id"]}};
        if (method == "initialize") {
            response["result"] = {{"serverInfo", {{"name", "fake"}}}};
        } else if (method == "tools/list") {
            response["result"] = {{"tools", {{{"name", "grep"}, {"description", "Search files"},
                                              {"inputSchema", {{"type", "object"}, {"required", {"pattern"}}}}}}}};
        } else if (message["params"]["name"] == "grep") {
            response["result"] = {{"content", {{{"type", "text"}, {"text", "a.txt:1\n"}}, {{"type", "text"}, {"text", "b.txt:4"}}}}};
        } else if (message["params"]["name"] == "broken") {
            response["result"] = {{"content", {{{"type", "text"}, {"text", "permission denied"}}}}, {"isError", true}};
        } else if (message["params"]["name"] == "stats") {
            response["result"] = {{"content", Value::array()}, {"structuredContent", {{"files", 2}}}};
        } else {
            response["error"] = {{"code", -32601}, {"message", "Method not found"}};
        }
        return response;
    }

    void notify(const Value& message) override { log_->push_back(message); }

private:
    std::vector<Value>* log_;
};

} // namespace

TEST_CASE("Builtins are tried before tool servers", "[dispatch]") {
    DispatchHarness h;
    auto server = std::make_shared<FakeServer>();
    h.servers.add_server("ops", server);
    h.builtins.register_tool("ops.restart", [](const Value&, ToolCallContext&) { return Value("builtin"); });

    DispatchResult result = h.dispatch("ops.restart", Value{{"service", "db"}});
    REQUIRE(result.route == DispatchRoute::BUILTIN);
    REQUIRE(result.value == "builtin");
    REQUIRE(server->calls == 0);
}

TEST_CASE("Namespaced names go to the tool server", "[dispatch][servers]") {
    DispatchHarness h;
    auto server = std::make_shared<FakeServer>();
    h.servers.add_server("ops", server);

    DispatchResult result = h.dispatch("ops.restart", Value{{"service", "db"}});
    REQUIRE(result.route == DispatchRoute::TOOL_SERVER);
    REQUIRE(result.value["restarted"] == "db");
    REQUIRE(server->last_tool == "restart");

    try {
        h.dispatch("ops.explode", Value::object());
        FAIL("expected CallFailure");
    } catch (const FlowError& e) {
        REQUIRE(e.code() == ErrorCode::CALL_FAILURE);
        REQUIRE(e.node() == "caller");
    }
}

TEST_CASE("Tool server registry splits at the first dot", "[dispatch][servers]") {
    ToolServerRegistry registry;
    registry.add_server("fs", std::make_shared<FakeServer>());

    std::shared_ptr<ToolServerClient> server;
    std::string tool;
    REQUIRE(registry.resolve("fs.read.all", server, tool));
    REQUIRE(tool == "read.all");
    REQUIRE_FALSE(registry.resolve("web.fetch", server, tool));
    REQUIRE_FALSE(registry.resolve("fs", server, tool));

    Value listed = registry.list_tools();
    REQUIRE(listed.size() == 1);
    REQUIRE(tool_definition_name(listed[0]) == "fs.restart");
}

TEST_CASE("JSON-RPC tool server handshake and calls", "[dispatch][servers][jsonrpc]") {
    std::vector<Value> log;
    JsonRpcToolServer server("files", std::make_unique<FakeTransport>(&log));

    Value tools = server.list_tools();
    REQUIRE(log.size() == 3);
    REQUIRE(log[0]["method"] == "initialize");
    REQUIRE(log[0]["params"]["protocolVersion"] == "2024-11-05");
    REQUIRE(log[1]["method"] == "notifications/initialized");
    REQUIRE_FALSE(log[1].contains("id"));
    REQUIRE(log[2]["method"] == "tools/list");
    REQUIRE(tool_definition_name(tools[0]) == "grep");
    REQUIRE(tools[0]["function"]["parameters"]["required"][0] == "pattern");

    REQUIRE(server.call_tool("grep", Value{{"pattern", "x"}}) == "a.txt:1\nb.txt:4");
    REQUIRE(log.back()["params"]["arguments"]["pattern"] == "x");
    REQUIRE(server.call_tool("stats", nullptr) == Value{{"files", 2}});

    // one handshake only
    size_t initializes = 0;
    for (const auto& m : log) initializes += m["method"] == "initialize" ? 1 : 0;
    REQUIRE(initializes == 1);

    REQUIRE(thrown_code([&] { server.call_tool("broken", Value::object()); }) == ErrorCode::CALL_FAILURE);
    REQUIRE(thrown_code([&] { server.call_tool("unknown", Value::object()); }) == ErrorCode::CALL_FAILURE);
}

TEST_CASE("A server that cannot start fails the call instead of the host", "[dispatch][servers][jsonrpc]") {
    JsonRpcToolServer ghost("ghost", std::make_unique<StdioTransport>(std::vector<std::string>{"/nonexistent/mcp-server"}));
    REQUIRE(thrown_code([&] { ghost.call_tool("grep", Value{{"pattern", "x"}}); }) == ErrorCode::CALL_FAILURE);
    // the pipe stays broken on later calls too
    REQUIRE(thrown_code([&] { ghost.list_tools(); }) == ErrorCode::CALL_FAILURE);
}

TEST_CASE("Unknown tools without a client bridge fail resolution", "[dispatch][bridge]") {
    DispatchHarness h;
    REQUIRE(thrown_code([&] { h.dispatch("ui.confirm", Value::object()); }) == ErrorCode::TOOL_RESOLUTION_ERROR);
}

TEST_CASE("Client bridge emits tool_call and returns the client's answer", "[dispatch][bridge]") {
    DispatchHarness h;
    h.bridge = std::make_unique<ClientBridge>(std::chrono::seconds(5));
    Value seen;
    h.client->on_tool_call = [&](const Event& e) {
        seen = e.data;
        h.bridge->resolve(e.data["id"].get<std::string>(), Value{{"confirmed", true}});
    };

    DispatchResult result = h.dispatch("ui.confirm", Value{{"question", "Deploy?"}});
    REQUIRE(result.route == DispatchRoute::CLIENT);
    REQUIRE(result.value["confirmed"] == true);
    REQUIRE_FALSE(result.executed_on_client);
    REQUIRE(seen["target"] == "ui.confirm");
    REQUIRE(seen["args"]["question"] == "Deploy?");
    REQUIRE(h.bridge->pending_ids().empty());
}

TEST_CASE("Results flagged executed_on_client are terminal", "[dispatch][bridge]") {
    DispatchHarness h;
    h.bridge = std::make_unique<ClientBridge>(std::chrono::seconds(5));
    h.client->on_tool_call = [&](const Event& e) {
        h.bridge->resolve(e.data["id"].get<std::string>(), Value{{"executed_on_client", true}, {"result", "shown"}});
    };

    REQUIRE(h.dispatch("ui.render_chart", Value::object()).executed_on_client);
    REQUIRE(ToolDispatcher::is_terminal(Value{{"executed_on_client", true}}));
    REQUIRE_FALSE(ToolDispatcher::is_terminal(Value{{"executed_on_client", false}}));
    REQUIRE_FALSE(ToolDispatcher::is_terminal("executed_on_client"));
}

TEST_CASE("Client bridge times out and forgets the call", "[dispatch][bridge]") {
    DispatchHarness h;
    h.bridge = std::make_unique<ClientBridge>(std::chrono::milliseconds(150));

    auto started = std::chrono::steady_clock::now();
    REQUIRE(thrown_code([&] { h.dispatch("ui.confirm", Value::object()); }) == ErrorCode::TOOL_TIMEOUT);
    REQUIRE(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(150));
    REQUIRE(h.bridge->pending_ids().empty());
    REQUIRE_FALSE(h.bridge->resolve("call_1", Value("too late")));
}

TEST_CASE("Client rejection is a call failure", "[dispatch][bridge]") {
    DispatchHarness h;
    h.bridge = std::make_unique<ClientBridge>(std::chrono::seconds(5));
    h.client->on_tool_call = [&](const Event& e) { h.bridge->reject(e.data["id"].get<std::string>(), "user declined"); };

    REQUIRE(thrown_code([&] { h.dispatch("ui.confirm", Value::object()); }) == ErrorCode::CALL_FAILURE);
}

TEST_CASE("cancel_all releases waiting calls", "[dispatch][bridge][cancel]") {
    DispatchHarness h;
    h.bridge = std::make_unique<ClientBridge>(std::chrono::seconds(30));

    std::thread canceller([&h] {
        while (h.bridge->pending_ids().empty()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        h.bridge->cancel_all("client disconnected");
    });
    REQUIRE(thrown_code([&] { h.dispatch("ui.confirm", Value::object()); }) == ErrorCode::CANCELLED);
    canceller.join();
}

TEST_CASE("Engine cancel releases a pending client call", "[dispatch][bridge][cancel][engine]") {
    auto engine = engine_from_yaml(R"(
nodes:
  ask: {call: ui.confirm, args: {question: "'Ship it?'"}}
)");
    engine->enable_client_bridge(std::chrono::seconds(30));
    auto client = std::make_shared<ScriptedClient>();
    engine->set_event_sink(client);

    std::thread canceller([&engine] {
        while (engine->client_bridge()->pending_ids().empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        engine->cancel("stop");
    });
    RunResult result = engine->run();
    canceller.join();

    REQUIRE_FALSE(result.success);
    REQUIRE(result.error->code == ErrorCode::CANCELLED);
    REQUIRE(result.error->node == "ask");
    REQUIRE(client->count("tool_call") == 1);
}

TEST_CASE("Workflow nodes reach tool servers and the client", "[dispatch][engine]") {
    auto engine = engine_from_yaml(R"(
exit: [confirm]
nodes:
  restart: {call: ops.restart, args: {service: "$input.service"}}
  confirm: {call: ui.confirm, args: {restarted: "$restart.output.restarted"}}
edges: ["restart -> confirm"]
)");
    auto server = std::make_shared<FakeServer>();
    engine->add_tool_server("ops", server);
    engine->enable_client_bridge(std::chrono::seconds(5));
    auto client = std::make_shared<ScriptedClient>();
    ClientBridge* bridge = engine->client_bridge();
    client->on_tool_call = [bridge](const Event& e) {
        bridge->resolve(e.data["id"].get<std::string>(), Value{{"ack", e.data["args"]["restarted"]}});
    };
    engine->set_event_sink(client);

    RunResult result = engine->run(Value{{"service", "cache"}});
    REQUIRE(result.success);
    REQUIRE(result.output["ack"] == "cache");
    REQUIRE(server->calls == 1);
}

TEST_CASE("Registered function tools run as builtins", "[dispatch][builtins]") {
    auto engine = engine_from_yaml(R"(
exit: [sum]
nodes:
  sum: {call: add, args: {a: 2, b: "$input.b"}}
)");
    engine->register_tool("add", [](const Value& args, ToolCallContext&) {
        return Value(args["a"].get<int>() + args["b"].get<int>());
    }, {"a", "b"});

    RunResult ok = engine->run(Value{{"b", 5}});
    REQUIRE(ok.success);
    REQUIRE(ok.output == 7);

    RunResult missing = engine->run(Value::object());
    REQUIRE_FALSE(missing.success);
    REQUIRE(missing.error->code == ErrorCode::MISSING_ARGUMENT);
}
