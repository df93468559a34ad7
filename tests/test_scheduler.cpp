// tests/test_scheduler.cpp
#include "test_support.h"
#include <algorithm>
#include <chrono>
#include <thread>

using namespace agentflow;
using agentflow::testing::count_status;
using agentflow::testing::engine_from_yaml;
using agentflow::testing::quiet_config;
using agentflow::testing::run_yaml;

namespace {

struct Observed {
    std::unique_ptr<WorkflowEngine> engine;
    std::shared_ptr<CollectingEventSink> sink;
    RunResult result;
};

Observed run_observed(const std::string& yaml, const Value& input = Value::object(),
                      EngineConfig config = quiet_config()) {
    Observed o;
    o.engine = engine_from_yaml(yaml, std::move(config));
    o.sink = std::make_shared<CollectingEventSink>();
    o.engine->set_event_sink(o.sink);
    o.result = o.engine->run(input);
    return o;
}

} // namespace

// Test 1: linear chain, output of the only exit node
TEST_CASE("Linear DAG Execution", "[stage1][scheduler]") {
    RunResult result = run_yaml(R"(
entry: [start]
exit: [done]
nodes:
  start: {call: set_context, args: {count: 1}}
  step:  {call: set_context, args: {count: "$ctx.count + 1"}}
  done:  {literal: {total: "$ctx.count * 10"}}
edges: ["start -> step -> done"]
)");

    REQUIRE(result.success);
    REQUIRE(result.final_context["count"] == 2);
    REQUIRE(result.output == Value{{"total", 20}});
}

// Test 2: a false condition prunes the whole downstream branch
TEST_CASE("Unreachable branches are pruned", "[stage1][scheduler]") {
    auto o = run_observed(R"(
nodes:
  a: {literal: 1}
  b: {call: set_context, args: {b_ran: true}}
  c: {call: set_context, args: {c_ran: true}}
  other: {call: set_context, args: {other_ran: true}}
edges:
  - {from: a, to: b, if: "$a.output > 5"}
  - "b -> c"
  - {from: a, to: other, if: "$a.output == 1"}
)");

    REQUIRE(o.result.success);
    REQUIRE_FALSE(o.result.final_context.contains("b_ran"));
    REQUIRE_FALSE(o.result.final_context.contains("c_ran"));
    REQUIRE(o.result.final_context["other_ran"] == true);

    auto traces = o.engine->get_last_traces();
    REQUIRE(count_status(traces, "b", "unreachable") == 1);
    REQUIRE(count_status(traces, "c", "unreachable") == 1);
    REQUIRE(count_status(traces, "b", "done") == 0);

    auto skipped = o.sink->events_of("node_skipped");
    REQUIRE(skipped.size() == 2);
    REQUIRE(skipped[0].node == "b");
    REQUIRE(skipped[1].node == "c");
}

// Test 3: diamond, the join runs exactly once
TEST_CASE("Diamond convergence runs the join once", "[stage1][scheduler]") {
    auto o = run_observed(R"(
exit: [d]
nodes:
  a: {literal: 1}
  b: {call: set_context, args: {path: "log", value: "b", mode: append}}
  c: {call: set_context, args: {path: "log", value: "c", mode: append}}
  d: {call: set_context, args: {path: "log", value: "d", mode: append}}
edges: ["a -> b -> d", "a -> c -> d"]
)");

    REQUIRE(o.result.success);
    auto traces = o.engine->get_last_traces();
    REQUIRE(count_status(traces, "d", "done") == 1);

    const Value& log = o.result.final_context["log"];
    REQUIRE(log.size() == 3);
    REQUIRE(std::count(log.begin(), log.end(), Value("d")) == 1);

    size_t d_starts = 0;
    for (const auto& e : o.sink->events_of("node_start")) {
        if (e.node == "d") ++d_starts;
    }
    REQUIRE(d_starts == 1);
}

// Test 4: one branch dead, the other alive, the join still runs
TEST_CASE("OR convergence fires on the first satisfied edge", "[stage1][scheduler]") {
    RunResult result = run_yaml(R"(
nodes:
  a: {literal: 1}
  b: {literal: "b"}
  c: {literal: "c"}
  d: {call: set_context, args: {joined: "$output"}}
edges:
  - {from: a, to: b, if: "false"}
  - "a -> c"
  - "b -> d"
  - "c -> d"
)");

    REQUIRE(result.success);
    REQUIRE(result.final_context["joined"] == "c");
}

// Test 5: router with a default edge
TEST_CASE("Router picks X, Y or the default Z", "[stage1][scheduler][router]") {
    const std::string router = R"(
exit: [finish]
nodes:
  route: {literal: "$input.kind"}
  x: {call: set_context, args: {path: "picked", value: "x"}}
  y: {call: set_context, args: {path: "picked", value: "y"}}
  z: {call: set_context, args: {path: "picked", value: "z"}}
  finish: {literal: "$ctx.picked"}
edges:
  - {from: route, to: x, if: "$route.output == 'x'"}
  - {from: route, to: y, if: "$route.output == 'y'"}
  - {from: route, to: z}
  - "x -> finish"
  - "y -> finish"
  - "z -> finish"
)";
    auto engine = engine_from_yaml(router);

    RunResult rx = engine->run(Value{{"kind", "x"}});
    REQUIRE(rx.success);
    REQUIRE(rx.output == "x");
    REQUIRE(count_status(engine->get_last_traces(), "z", "unreachable") == 1);

    RunResult ry = engine->run(Value{{"kind", "y"}});
    REQUIRE(ry.output == "y");

    RunResult rz = engine->run(Value{{"kind", "other"}});
    REQUIRE(rz.output == "z");
    auto traces = engine->get_last_traces();
    REQUIRE(count_status(traces, "x", "unreachable") == 1);
    REQUIRE(count_status(traces, "y", "unreachable") == 1);
    REQUIRE(count_status(traces, "finish", "done") == 1);
}

// Test 6: a failure routed through on_error
TEST_CASE("OnError edge handles a failing node", "[stage1][scheduler][error]") {
    auto o = run_observed(R"(
nodes:
  risky: {call: fail, args: {message: "'card declined'"}}
  success: {call: set_context, args: {ok: true}}
  handler: {call: set_context, args: {handled: "$error.node == 'risky'", reason: "$error.message", code: "$error.code"}}
edges:
  - "risky -> success"
  - {from: risky, to: handler, on_error: true}
)");

    REQUIRE(o.result.success);
    REQUIRE(o.result.final_context["handled"] == true);
    REQUIRE(o.result.final_context["reason"] == "card declined");
    REQUIRE(o.result.final_context["code"] == "CallFailure");
    REQUIRE_FALSE(o.result.final_context.contains("ok"));
    // the handler's output is the run's output
    REQUIRE(o.result.output["handled"] == true);

    auto traces = o.engine->get_last_traces();
    REQUIRE(count_status(traces, "risky", "failed") == 1);
    REQUIRE(count_status(traces, "success", "unreachable") == 1);

    auto errors = o.sink->events_of("error");
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].node == "risky");
}

TEST_CASE("Only the first declared OnError edge fires", "[scheduler][error]") {
    RunResult result = run_yaml(R"(
nodes:
  risky: {call: fail, args: {}}
  first: {call: set_context, args: {first: true}}
  second: {call: set_context, args: {second: true}}
edges:
  - {from: risky, to: first, on_error: true}
  - {from: risky, to: second, on_error: true}
)");
    REQUIRE(result.success);
    REQUIRE(result.final_context["first"] == true);
    REQUIRE_FALSE(result.final_context.contains("second"));
}

TEST_CASE("Unhandled failure fails the run", "[scheduler][error]") {
    auto o = run_observed(R"(
nodes:
  a: {literal: 1}
  broken: {call: no_such_tool, args: {}}
  after: {literal: 2}
edges: ["a -> broken -> after"]
)");

    REQUIRE_FALSE(o.result.success);
    REQUIRE(o.result.error.has_value());
    REQUIRE(o.result.error->code == ErrorCode::TOOL_RESOLUTION_ERROR);
    REQUIRE(o.result.error->node == "broken");
    REQUIRE(o.result.message.rfind("[broken]", 0) == 0);
    REQUIRE(count_status(o.engine->get_last_traces(), "after", "unreachable") == 1);

    auto done = o.sink->events_of("done");
    REQUIRE(done.size() == 1);
    REQUIRE(done[0].data["success"] == false);
    REQUIRE(done[0].data["error"]["code"] == "ToolResolutionError");
    REQUIRE(o.sink->events().back().type == "done");
}

TEST_CASE("A broken edge condition fails its source node", "[scheduler][error]") {
    RunResult handled = run_yaml(R"(
nodes:
  a: {literal: 1}
  b: {literal: 2}
  h: {call: set_context, args: {caught: "$error.code"}}
edges:
  - {from: a, to: b, if: "$a.output / 0 > 1"}
  - {from: a, to: h, on_error: true}
)");
    REQUIRE(handled.success);
    REQUIRE(handled.final_context["caught"] == "EvalError");
    REQUIRE(handled.final_context["error"]["node"] == "a");

    RunResult unhandled = run_yaml(R"(
nodes:
  a: {literal: 1}
  b: {literal: 2}
edges:
  - {from: a, to: b, if: "len($a.output) > 0"}
)");
    REQUIRE_FALSE(unhandled.success);
    REQUIRE(unhandled.error->code == ErrorCode::EVAL_ERROR);
    REQUIRE(unhandled.error->node == "a");

    // a condition that does not parse is rejected at load time
    REQUIRE(agentflow::testing::thrown_code([] {
                engine_from_yaml("nodes: {a: {literal: 1}, b: {literal: 2}}\nedges: [{from: a, to: b, if: \"nope(\"}]\n");
            }) == ErrorCode::GRAPH_ERROR);
}

TEST_CASE("Declared entry nodes start the run", "[scheduler][entry]") {
    auto o = run_observed(R"(
entry: [start]
nodes:
  start: {call: set_context, args: {started: true}}
  orphan: {call: set_context, args: {orphan: true}}
  next: {literal: "$ctx.started"}
edges: ["start -> next"]
)");

    REQUIRE(o.result.success);
    REQUIRE(o.result.output == true);
    REQUIRE_FALSE(o.result.final_context.contains("orphan"));
    REQUIRE(count_status(o.engine->get_last_traces(), "orphan", "unreachable") == 1);
}

TEST_CASE("Several exit nodes give an object keyed by id", "[scheduler][exit]") {
    RunResult result = run_yaml(R"(
exit: [left, right]
nodes:
  left: {literal: "'L'"}
  right: {literal: [1, 2]}
)");
    REQUIRE(result.success);
    REQUIRE(result.output == Value{{"left", "L"}, {"right", {1, 2}}});
}

TEST_CASE("Repeated runs are independent and give the same result", "[scheduler][idempotent]") {
    auto engine = engine_from_yaml(R"yaml(
exit: [sum]
nodes:
  seed: {call: set_context, args: {path: "items", value: "$input.items", mode: append}}
  sum: {literal: {count: "len($ctx.items)", first: "$ctx.items[0]"}}
edges: ["seed -> sum"]
)yaml");
    Value input = {{"items", {3, 4}}};
    RunResult first = engine->run(input);
    RunResult second = engine->run(input);

    REQUIRE(first.success);
    REQUIRE(second.success);
    REQUIRE(first.output == Value{{"count", 2}, {"first", 3}});
    REQUIRE(first.output == second.output);
    REQUIRE(first.final_context == second.final_context);
}

TEST_CASE("Node budget stops the run", "[scheduler][budget]") {
    EngineConfig config = quiet_config();
    config.limits.max_nodes = 2;
    auto engine = engine_from_yaml(R"(
nodes:
  a: {literal: 1}
  b: {literal: 2}
  c: {literal: 3}
edges: ["a -> b -> c"]
)", config);

    RunResult result = engine->run();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error->code == ErrorCode::BUDGET_EXCEEDED);
    REQUIRE(result.error->node == "c");
}

TEST_CASE("Independent nodes run concurrently", "[scheduler][concurrency]") {
    auto engine = engine_from_yaml(R"(
nodes:
  slow_a: {call: timer, args: {ms: 400}}
  slow_b: {call: timer, args: {ms: 400}}
  join: {literal: "'joined'"}
edges: ["slow_a -> join", "slow_b -> join"]
)");

    auto started = std::chrono::steady_clock::now();
    RunResult result = engine->run();
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.success);
    REQUIRE(result.output == "joined");
    REQUIRE(elapsed < std::chrono::milliseconds(750));
}

TEST_CASE("Cancel stops a running workflow", "[scheduler][cancel]") {
    auto engine = engine_from_yaml(R"(
nodes:
  wait: {call: timer, args: {ms: 5000}}
  after: {literal: 1}
edges: ["wait -> after"]
)");

    std::thread canceller([&engine] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        engine->cancel("user pressed stop");
    });
    RunResult result = engine->run();
    canceller.join();

    REQUIRE_FALSE(result.success);
    REQUIRE(result.error->code == ErrorCode::CANCELLED);
    REQUIRE(result.message.find("user pressed stop") != std::string::npos);
}

TEST_CASE("Run timeout cancels outstanding work", "[scheduler][cancel][budget]") {
    EngineConfig config = quiet_config();
    config.limits.max_duration_sec = 1;
    auto engine = engine_from_yaml("nodes:\n  wait: {call: timer, args: {ms: 4000}}\n", config);

    RunResult result = engine->run();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error->code == ErrorCode::CANCELLED);
}

TEST_CASE("Running without a workflow reports a graph error", "[scheduler]") {
    WorkflowEngine engine(quiet_config());
    REQUIRE_FALSE(engine.loaded());
    RunResult result = engine.run();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error->code == ErrorCode::GRAPH_ERROR);
}
