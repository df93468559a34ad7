// tests/test_graph_merger.cpp
#include "graph/graph_merger.h"
#include "graph/graph_validator.h"
#include "test_support.h"

using namespace agentflow;
using agentflow::testing::TempDir;
using agentflow::testing::quiet_config;
using agentflow::testing::thrown_code;

namespace {

const LiteralNode& literal(const WorkflowGraph& g, const NodeId& id) {
    const Node* node = g.find_node(id);
    REQUIRE(node != nullptr);
    REQUIRE(node->kind == NodeKind::LITERAL);
    return static_cast<const LiteralNode&>(*node);
}

bool has_edge(const WorkflowGraph& g, const NodeId& from, const NodeId& to) {
    for (const auto& e : g.edges) {
        if (e.from == from && e.to == to) return true;
    }
    return false;
}

// order.yaml -> payment.yaml -> card.yaml
void write_order_flows(const TempDir& dir) {
    dir.write("card.yaml", R"(
name: card
nodes:
  charge:
    literal: {id: "'c-1'", amount: "$ctx.total"}
  audit:
    literal: "$charge.output.id + ' / $charge'"
edges:
  - "charge -> audit"
)");

    dir.write("payment.yaml", R"(
name: payment
flows:
  card: card.yaml
nodes:
  validate:
    literal: "$ctx.total > 0"
  summary:
    literal: {charged: "$card.charge.output.amount", checked: "$validate.output", raw: "$ctx.validate"}
edges:
  - "validate -> card.charge"
  - "card.audit -> summary"
)");

    dir.write("order.yaml", R"(
name: order
flows:
  payment: payment.yaml
exit: [finish]
nodes:
  start:
    call: set_context
    args: {total: 10}
  finish:
    call: set_context
    args: {receipt: "$payment.card.charge.output.id", summary: "$payment.summary.output"}
edges:
  - "start -> payment.validate"
  - "payment.summary -> finish"
)");
}

} // namespace

// Test 1: ids and references are prefixed at every depth
TEST_CASE("Nested imports prefix ids and references", "[merge]") {
    TempDir dir;
    write_order_flows(dir);

    WorkflowGraph g = GraphMerger().merge(dir.path("order.yaml"));

    REQUIRE(g.has_node("start"));
    REQUIRE(g.has_node("payment.validate"));
    REQUIRE(g.has_node("payment.card.charge"));
    REQUIRE(g.has_node("payment.card.audit"));
    REQUIRE(g.flows.empty());

    REQUIRE(has_edge(g, "payment.card.charge", "payment.card.audit"));
    REQUIRE(has_edge(g, "payment.validate", "payment.card.charge"));
    REQUIRE(has_edge(g, "payment.card.audit", "payment.summary"));
    REQUIRE(has_edge(g, "start", "payment.validate"));

    // string literal content is never rewritten
    REQUIRE(literal(g, "payment.card.audit").value == "$payment.card.charge.output.id + ' / $charge'");

    const Value& summary = literal(g, "payment.summary").value;
    REQUIRE(summary["charged"] == "$payment.card.charge.output.amount");
    REQUIRE(summary["checked"] == "$payment.validate.output");
    // reserved roots stay as written even when a local id has the same name
    REQUIRE(summary["raw"] == "$ctx.validate");
    REQUIRE(literal(g, "payment.card.charge").value["amount"] == "$ctx.total");
}

TEST_CASE("Merged graph runs on one shared context", "[merge][engine]") {
    TempDir dir;
    write_order_flows(dir);

    auto engine = std::make_unique<WorkflowEngine>(quiet_config());
    engine->load(dir.path("order.yaml"));
    RunResult result = engine->run();

    REQUIRE(result.success);
    REQUIRE(result.final_context["receipt"] == "c-1");
    REQUIRE(result.final_context["summary"]["charged"] == 10);
    REQUIRE(result.final_context["summary"]["checked"] == true);
    REQUIRE(result.output["receipt"] == "c-1");
}

TEST_CASE("Imported literals follow their siblings into the alias", "[merge]") {
    TempDir dir;
    dir.write("child.yaml", R"(
nodes:
  a: {literal: 41}
  b: {literal: "$a.output + 1"}
  c: {call: set_context, args: {v: "$a.output + 1", note: "Total: $a.output items"}}
  d: {literal: {label: "Total: $a.output items", ctx: "$ctx.a"}}
edges: ["a -> b -> c -> d"]
)");
    dir.write("main.yaml", R"(
flows: {sub: child.yaml}
exit: [done]
nodes:
  done: {call: set_context, args: {sum: "$sub.b.output"}}
edges: ["sub.d -> done"]
)");

    WorkflowGraph g = GraphMerger(GraphMerger::Config{true}).merge(dir.path("main.yaml"));
    REQUIRE(literal(g, "sub.b").value == "$sub.a.output + 1");
    REQUIRE(literal(g, "sub.d").value["label"] == "Total: $sub.a.output items");
    REQUIRE(literal(g, "sub.d").value["ctx"] == "$ctx.a");

    const Node* c = g.find_node("sub.c");
    REQUIRE(c != nullptr);
    const auto& args = static_cast<const CallNode&>(*c).arguments;
    REQUIRE(args["v"] == "$sub.a.output + 1");
    REQUIRE(args["note"] == "Total: $sub.a.output items");

    auto engine = std::make_unique<WorkflowEngine>(quiet_config());
    engine->load(dir.path("main.yaml"));
    RunResult result = engine->run();
    REQUIRE(result.success);
    REQUIRE(result.final_context["v"] == 42);
    REQUIRE(result.final_context["sum"] == 42);
}

// Test 2: A -> B -> A fails naming the chain
TEST_CASE("Import cycle is rejected with the full chain", "[merge]") {
    TempDir dir;
    dir.write("a.yaml", "flows: {b: b.yaml}\nnodes: {x: {literal: 1}}\n");
    dir.write("b.yaml", "flows: {a: a.yaml}\nnodes: {y: {literal: 2}}\n");

    try {
        GraphMerger().merge(dir.path("a.yaml"));
        FAIL("expected CircularImport");
    } catch (const FlowError& e) {
        REQUIRE(e.code() == ErrorCode::CIRCULAR_IMPORT);
        std::string msg = e.what();
        auto first = msg.find("a.yaml -> ");
        auto second = msg.find("b.yaml -> ");
        REQUIRE(first != std::string::npos);
        REQUIRE(second != std::string::npos);
        REQUIRE(first < second);
        REQUIRE(msg.substr(msg.size() - 6) == "a.yaml");
        REQUIRE(e.details()["chain"].size() == 2);
    }
}

TEST_CASE("Self import is a cycle", "[merge]") {
    TempDir dir;
    dir.write("loop.yaml", "flows: {again: loop.yaml}\nnodes: {x: {literal: 1}}\n");
    REQUIRE(thrown_code([&] { GraphMerger().merge(dir.path("loop.yaml")); }) == ErrorCode::CIRCULAR_IMPORT);
}

TEST_CASE("The same unit may be imported under two aliases", "[merge]") {
    TempDir dir;
    dir.write("common.yaml", "nodes: {step: {literal: \"$ctx.n\"}}\n");
    dir.write("main.yaml", R"(
flows: {left: common.yaml, right: common.yaml}
nodes: {join: {literal: "$left.step.output + $right.step.output"}}
edges: ["left.step -> join", "right.step -> join"]
)");

    WorkflowGraph g = GraphMerger().merge(dir.path("main.yaml"));
    REQUIRE(literal(g, "left.step").value == "$ctx.n");
    REQUIRE(literal(g, "right.step").value == "$ctx.n");
    REQUIRE(literal(g, "join").value == "$left.step.output + $right.step.output");
}

// Test 3: resource patterns resolve against the declaring unit and are de-duplicated
TEST_CASE("Resource patterns are unioned and de-duplicated", "[merge][resources]") {
    TempDir dir;
    dir.write("child.yaml", R"(
prompts: ["prompts/*.prompt"]
tools: ["tools/*.json"]
nodes: {c: {literal: 1}}
)");
    dir.write("main.yaml", R"(
flows: {child: child.yaml}
prompts: ["prompts/*.prompt"]
agents: ["agents/*.yaml"]
nodes: {m: {literal: 2}}
)");

    WorkflowGraph g = GraphMerger().merge(dir.path("main.yaml"));

    size_t prompts = 0, tools = 0, agents = 0;
    for (const auto& r : g.resources) {
        REQUIRE(r.pattern.rfind(dir.path(), 0) == 0);
        if (r.kind == ResourceKind::PROMPT) ++prompts;
        if (r.kind == ResourceKind::TOOL) ++tools;
        if (r.kind == ResourceKind::AGENT) ++agents;
    }
    REQUIRE(prompts == 1);
    REQUIRE(tools == 1);
    REQUIRE(agents == 1);
}

TEST_CASE("Reserved or colliding aliases are graph errors", "[merge]") {
    TempDir dir;
    dir.write("child.yaml", "nodes: {c: {literal: 1}}\n");

    dir.write("reserved.yaml", "flows: {ctx: child.yaml}\nnodes: {m: {literal: 2}}\n");
    REQUIRE(thrown_code([&] { GraphMerger().merge(dir.path("reserved.yaml")); }) == ErrorCode::GRAPH_ERROR);

    dir.write("collide.yaml", "flows: {m: child.yaml}\nnodes: {m: {literal: 2}}\n");
    REQUIRE(thrown_code([&] { GraphMerger().merge(dir.path("collide.yaml")); }) == ErrorCode::GRAPH_ERROR);
}

TEST_CASE("Validation rejects dangling edges and unknown exits", "[merge][validate]") {
    auto graph = WorkflowLoader::load_string(R"(
exit: [nowhere]
nodes: {a: {literal: 1}}
edges: ["a -> b"]
)");
    ValidationReport report = validate_graph(graph);
    REQUIRE_FALSE(report.ok());
    REQUIRE(report.errors.size() == 2);

    REQUIRE(thrown_code([&] { agentflow::testing::engine_from_yaml("nodes: {a: {literal: 1}}\nedges: [\"a -> b\"]\n"); }) ==
            ErrorCode::GRAPH_ERROR);
}

TEST_CASE("Malformed documents are parse errors", "[merge][loader]") {
    REQUIRE(thrown_code([] { WorkflowLoader::load_string("nodes: [unclosed"); }) == ErrorCode::PARSE_ERROR);
    REQUIRE(thrown_code([] { WorkflowLoader::load_string("nodes: {a: {shell: ls}}"); }) == ErrorCode::PARSE_ERROR);
    REQUIRE(thrown_code([] { WorkflowLoader::load_string("nodes: {a: {literal: 1}, a2: {foreach: {var: x}}}"); }) ==
            ErrorCode::PARSE_ERROR);
    REQUIRE(thrown_code([] { WorkflowLoader::load_string("nodes: {a: {literal: 1}}\nedges: [\"a\"]"); }) ==
            ErrorCode::PARSE_ERROR);

    TempDir dir;
    REQUIRE(thrown_code([&] { GraphMerger().merge(dir.path("missing.yaml")); }) == ErrorCode::PARSE_ERROR);
}

TEST_CASE("Chained edge shorthand and inline next", "[loader]") {
    auto g = WorkflowLoader::load_string(R"(
nodes:
  a: {literal: 1, next: [b, {to: c, if: "$a.output > 0"}], on_error: d}
  b: {literal: 2}
  c: {literal: 3}
  d: {literal: 4}
edges:
  - "b -> c -> d"
)");
    REQUIRE(g.edges.size() == 5);
    REQUIRE(g.edges[1].is_conditional());
    REQUIRE(g.edges[2].kind == EdgeKind::ON_ERROR);
    REQUIRE(g.edges[4].from == "c");
    REQUIRE(g.edges[4].to == "d");
}
