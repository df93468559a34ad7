// tests/test_expression.cpp
#include "context/value_path.h"
#include "expr/expression.h"
#include "expr/variable_resolver.h"
#include "test_support.h"

using namespace agentflow;
using agentflow::testing::thrown_code;

namespace {

// Resolves `$path` straight from one JSON document
class DocumentLookup : public VariableLookup {
public:
    explicit DocumentLookup(Value doc) : doc_(std::move(doc)) {}
    Value lookup(const VariablePath& path) const override { return get_at_path(doc_, path); }

private:
    Value doc_;
};

Value eval(const std::string& expr, const Value& doc = Value::object()) {
    return evaluate_expression(expr, DocumentLookup(doc));
}

} // namespace

TEST_CASE("Arithmetic and precedence", "[expr]") {
    REQUIRE(eval("1 + 2 * 3") == 7);
    REQUIRE(eval("(1 + 2) * 3") == 9);
    REQUIRE(eval("10 % 4") == 2);
    REQUIRE(eval("-3 + 5") == 2);
    REQUIRE(eval("7 / 2") == 3.5);
}

TEST_CASE("Division by zero is an evaluation error", "[expr]") {
    REQUIRE(thrown_code([] { eval("1 / 0"); }) == ErrorCode::EVAL_ERROR);
    REQUIRE(thrown_code([] { eval("5 % 0"); }) == ErrorCode::EVAL_ERROR);
}

TEST_CASE("String and array concatenation", "[expr]") {
    REQUIRE(eval("'order-' + 42") == "order-42");
    REQUIRE(eval("\"a\" + 'b'") == "ab");
    REQUIRE(eval("[1, 2] + [3]") == Value::array({1, 2, 3}));
}

TEST_CASE("Comparison and logic", "[expr]") {
    REQUIRE(eval("3 > 2 && 2 >= 2") == true);
    REQUIRE(eval("1 == 1 and 2 != 3") == true);
    REQUIRE(eval("not false or false") == true);
    REQUIRE(eval("!(1 < 0)") == true);
    REQUIRE(eval("null == null") == true);
}

TEST_CASE("Variables with member and index access", "[expr]") {
    Value doc = {{"ctx", {{"items", {{{"name", "a"}}, {{"name", "b"}}}}, {"n", 3}}}};

    REQUIRE(eval("$ctx.items[1].name", doc) == "b");
    REQUIRE(eval("$ctx.n > 2 ? 'big' : 'small'", doc) == "big");
    REQUIRE(eval("$ctx.missing.deeper", doc).is_null());
    REQUIRE(eval("len($ctx.items)", doc) == 2);
}

TEST_CASE("Literal objects and arrays", "[expr]") {
    Value v = eval("{status: 'ok', codes: [1, 2]}");
    REQUIRE(v["status"] == "ok");
    REQUIRE(v["codes"].size() == 2);
}

TEST_CASE("Built-in functions", "[expr]") {
    Value doc = {{"ctx", {{"users", {{{"name", "ann"}, {"role", "admin"}}, {{"name", "bob"}, {"role", "user"}}}}}}};

    REQUIRE(eval("upper('abc')") == "ABC");
    REQUIRE(eval("trim('  x  ')") == "x");
    REQUIRE(eval("join(['a', 'b'], '-')") == "a-b");
    REQUIRE(eval("split('a,b,c')").size() == 3);
    REQUIRE(eval("range(3)") == Value::array({0, 1, 2}));
    REQUIRE(eval("map($ctx.users, 'name')", doc) == Value::array({"ann", "bob"}));
    REQUIRE(eval("len(filter($ctx.users, 'role', 'admin'))", doc) == 1);
    REQUIRE(eval("default($ctx.nothing, 'fallback')", doc) == "fallback");
    REQUIRE(eval("contains('hello', 'ell')") == true);
    REQUIRE(eval("json('{\"k\": 1}').k") == 1);
    REQUIRE(eval("type([])") == "array");
    REQUIRE(eval("int('12') + 1") == 13);
}

TEST_CASE("Unknown functions fail", "[expr]") {
    REQUIRE(thrown_code([] { eval("frobnicate(1)"); }) == ErrorCode::EVAL_ERROR);
}

TEST_CASE("Non-expressions are detected without throwing", "[expr]") {
    REQUIRE_FALSE(Expression::try_parse("hello world").has_value());
    REQUIRE_FALSE(Expression::try_parse("1 +").has_value());
    REQUIRE(Expression::try_parse("$ctx.a == 'b'").has_value());
    REQUIRE(thrown_code([] { Expression::parse("(1"); }) == ErrorCode::EVAL_ERROR);
}

TEST_CASE("Variable listing follows source order", "[expr]") {
    auto vars = Expression::parse("$a.b + $ctx.c[0]").variables();
    REQUIRE(vars.size() == 2);
    REQUIRE(vars[0] == VariablePath{"a", "b"});
    REQUIRE(vars[1] == VariablePath{"ctx", "c", "0"});
}

TEST_CASE("Reference prefixing leaves strings and reserved roots alone", "[expr][merge]") {
    std::unordered_set<std::string> local = {"charge", "refund"};

    REQUIRE(prefix_references("$charge.output.id == '$charge'", "payment", local) ==
            "$payment.charge.output.id == '$charge'");
    REQUIRE(prefix_references("$ctx.charge + $input.refund", "payment", local) == "$ctx.charge + $input.refund");
    REQUIRE(prefix_references("$other.output", "payment", local) == "$other.output");
    // plain text is not an expression and stays as written
    REQUIRE(prefix_references("charge the card", "payment", local) == "charge the card");
    // refs embedded in free text still move with the graph
    REQUIRE(prefix_references("Total: $charge.output items, $ctx.n", "payment", local) ==
            "Total: $payment.charge.output items, $ctx.n");
    REQUIRE(prefix_references("cost $5 for $refund", "payment", local) == "cost $5 for $payment.refund");
}

TEST_CASE("Oversized ranges and indices are evaluation errors", "[expr]") {
    REQUIRE(thrown_code([] { eval("range(0, 1e12)"); }) == ErrorCode::EVAL_ERROR);
    REQUIRE(thrown_code([] { eval("range(1e300)"); }) == ErrorCode::EVAL_ERROR);
    REQUIRE(eval("range(5, 2)") == Value::array());
    REQUIRE(eval("range(2, 4)") == Value::array({2, 3}));

    REQUIRE(thrown_code([] { eval("[1, 2][1e300]"); }) == ErrorCode::EVAL_ERROR);
    REQUIRE(thrown_code([] { eval("'ab'[-1e300]"); }) == ErrorCode::EVAL_ERROR);
    REQUIRE(eval("[1, 2][5]").is_null());
    REQUIRE(eval("[1, 2][-1]") == 2);
}

TEST_CASE("Resolver order: loop variables, node outputs, then ctx keys", "[expr][context]") {
    ExecutionContext context(Value{{"user", "ann"}});
    context.set("error", Value{{"node", "risky"}});
    context.set("shared", "from-ctx");
    context.record_output("payment.charge", Value{{"id", 7}});

    LoopScopes scopes;
    scopes.push_back(LoopScope{"item", Value{{"sku", "A1"}}, 2, false, true});
    VariableResolver resolver(context, scopes);

    REQUIRE(resolver.evaluate("$input.user") == "ann");
    REQUIRE(resolver.evaluate("$item.sku") == "A1");
    REQUIRE(resolver.evaluate("$loop.index") == 2);
    REQUIRE(resolver.evaluate("$loop.last") == true);
    REQUIRE(resolver.evaluate("$payment.charge.output.id") == 7);
    REQUIRE(resolver.evaluate("$output.id") == 7);
    REQUIRE(resolver.evaluate("$error.node") == "risky");
    REQUIRE(resolver.evaluate("$shared") == "from-ctx");
}

TEST_CASE("Argument evaluation keeps non-expressions literal", "[expr]") {
    ExecutionContext context;
    context.set("n", 2);
    LoopScopes scopes;
    VariableResolver resolver(context, scopes);

    Value args = {{"text", "plain words here"}, {"count", "$ctx.n * 2"}, {"nested", {{"list", {"$ctx.n", 5}}}},
                  {"flag", true}};
    Value out = resolver.evaluate_arguments(args);
    REQUIRE(out["text"] == "plain words here");
    REQUIRE(out["count"] == 4);
    REQUIRE(out["nested"]["list"] == Value::array({2, 5}));
    REQUIRE(out["flag"] == true);
}
