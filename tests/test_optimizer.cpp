#include <catch2/catch_test_macros.hpp>
#include "kestrel/optimizer.h"
#include "kestrel/engine.h"
#include "kestrel/parser.h"
#include "kestrel/scope.h"

#include <stdexcept>

using namespace kestrel;

namespace {

struct Optimized {
    std::shared_ptr<Ast> ast;
    OptimizerStats stats;

    const AstNode& stmt(size_t i) const { return *ast->statements().at(i); }
    size_t count() const { return ast->statements().size(); }
};

Optimized optimizeSource(std::string_view source,
                         OptimizationLevel level = OptimizationLevel::Simple,
                         const Scope* constants = nullptr,
                         const FunctionRegistry* registry = nullptr) {
    Optimized result;
    result.ast = Parser::parse(source);
    result.stats = optimize(*result.ast, level, constants, registry);
    return result;
}

Value run(std::string_view source, OptimizationLevel level) {
    DialectConfig dialect;
    dialect.optimization_level = level;
    FunctionRegistry registry;
    Scope scope;
    auto ast = compile(source, dialect, &registry);
    return evaluate(*ast, scope, registry);
}

} // anonymous namespace

// -- Folding --

TEST_CASE("Optimizer folds arithmetic", "[optimizer]") {
    auto r = optimizeSource("1 + 2 * 3");
    REQUIRE(r.count() == 1);
    CHECK(r.stmt(0).kind == AstNodeKind::IntLit);
    CHECK(r.stmt(0).intValue == 7);
    CHECK(r.stats.folded == 2);
}

TEST_CASE("Optimizer folds unary operators", "[optimizer]") {
    auto r = optimizeSource("-5");
    CHECK(r.stmt(0).kind == AstNodeKind::IntLit);
    CHECK(r.stmt(0).intValue == -5);

    r = optimizeSource("!(1 < 2)");
    CHECK(r.stmt(0).kind == AstNodeKind::BoolLit);
    CHECK_FALSE(r.stmt(0).boolValue);
}

TEST_CASE("Optimizer folds strings", "[optimizer]") {
    auto r = optimizeSource("\"ab\" + \"cd\"");
    REQUIRE(r.stmt(0).kind == AstNodeKind::StringLit);
    CHECK(r.stmt(0).stringValue == "abcd");
}

TEST_CASE("Optimizer leaves failing operations for runtime", "[optimizer]") {
    auto r = optimizeSource("1 / 0");
    CHECK(r.stmt(0).kind == AstNodeKind::Binary);
    CHECK(r.stats.folded == 0);

    r = optimizeSource("9223372036854775807 + 1");
    CHECK(r.stmt(0).kind == AstNodeKind::Binary);
}

TEST_CASE("Optimizer short-circuits logical operators", "[optimizer]") {
    auto r = optimizeSource("false && f()");
    REQUIRE(r.stmt(0).kind == AstNodeKind::BoolLit);
    CHECK_FALSE(r.stmt(0).boolValue);

    r = optimizeSource("true || f()");
    REQUIRE(r.stmt(0).kind == AstNodeKind::BoolLit);
    CHECK(r.stmt(0).boolValue);

    r = optimizeSource("true && false");
    REQUIRE(r.stmt(0).kind == AstNodeKind::BoolLit);
    CHECK_FALSE(r.stmt(0).boolValue);

    // The right side still has to be checked at runtime
    r = optimizeSource("true && x");
    CHECK(r.stmt(0).kind == AstNodeKind::And);
}

TEST_CASE("Optimizer folds coalesce with a literal left side", "[optimizer]") {
    auto r = optimizeSource("() ?? 5");
    REQUIRE(r.stmt(0).kind == AstNodeKind::IntLit);
    CHECK(r.stmt(0).intValue == 5);

    r = optimizeSource("1 ?? f()");
    REQUIRE(r.stmt(0).kind == AstNodeKind::IntLit);
    CHECK(r.stmt(0).intValue == 1);

    r = optimizeSource("x ?? 1");
    CHECK(r.stmt(0).kind == AstNodeKind::Coalesce);
}

// -- Constant propagation --

TEST_CASE("Optimizer propagates script constants", "[optimizer]") {
    auto r = optimizeSource("const N = 10; let y = N * 2; y");
    REQUIRE(r.count() == 3);
    const AstNode& init = *r.stmt(1).children[0];
    REQUIRE(init.kind == AstNodeKind::IntLit);
    CHECK(init.intValue == 20);
    CHECK(r.stmt(2).kind == AstNodeKind::Name);
    CHECK(r.stats.propagated == 1);
}

TEST_CASE("Optimizer does not propagate plain variables", "[optimizer]") {
    auto r = optimizeSource("let n = 10; n + 1");
    CHECK(r.stmt(1).kind == AstNodeKind::Binary);
    CHECK(r.stats.propagated == 0);
}

TEST_CASE("Optimizer respects shadowing", "[optimizer]") {
    auto r = optimizeSource("const N = 1; { let N = 5; N }");
    const AstNode& block = r.stmt(1);
    REQUIRE(block.kind == AstNodeKind::Block);
    CHECK(block.children[1]->kind == AstNodeKind::Name);

    // The constant is visible again once the block ends
    r = optimizeSource("const N = 1; { let N = 5; N }; N");
    REQUIRE(r.stmt(2).kind == AstNodeKind::IntLit);
    CHECK(r.stmt(2).intValue == 1);

    r = optimizeSource("const N = 1; for N in [7] { N }");
    const AstNode& body = *r.stmt(1).children[1];
    CHECK(body.children[0]->kind == AstNodeKind::Name);
}

TEST_CASE("Optimizer does not propagate into function bodies", "[optimizer]") {
    auto r = optimizeSource("const N = 3; fn f() { N }");
    const AstNode& fnBody = *r.stmt(1).function->body;
    REQUIRE(fnBody.children.size() == 1);
    CHECK(fnBody.children[0]->kind == AstNodeKind::Name);

    r = optimizeSource("const N = 3; let g = || N + 1;");
    const AstNode& closure = *r.stmt(1).children[0];
    REQUIRE(closure.kind == AstNodeKind::Closure);
    CHECK(closure.function->body->kind != AstNodeKind::IntLit);
}

TEST_CASE("Optimizer folds inside function bodies", "[optimizer]") {
    auto r = optimizeSource("fn f(x) { x + 2 * 3 }");
    const AstNode& body = *r.stmt(0).function->body;
    const AstNode& sum = *body.children[0];
    REQUIRE(sum.kind == AstNodeKind::Binary);
    CHECK(sum.children[1]->kind == AstNodeKind::IntLit);
    CHECK(sum.children[1]->intValue == 6);
}

TEST_CASE("Optimizer propagates host constants", "[optimizer]") {
    Scope constants;
    constants.defineConstant("LIMIT", Value::integer(5));
    constants.define("plain", Value::integer(1));

    auto r = optimizeSource("let a = LIMIT + 1; plain", OptimizationLevel::Simple, &constants);
    const AstNode& init = *r.stmt(0).children[0];
    REQUIRE(init.kind == AstNodeKind::IntLit);
    CHECK(init.intValue == 6);
    CHECK(r.stmt(1).kind == AstNodeKind::Name);
}

TEST_CASE("Optimizer assignment targets keep their root name", "[optimizer]") {
    auto r = optimizeSource("const I = 1; let a = [1, 2]; a[I] = I;");
    const AstNode& assign = r.stmt(2);
    REQUIRE(assign.kind == AstNodeKind::Assign);
    const AstNode& target = *assign.children[0];
    CHECK(target.children[0]->kind == AstNodeKind::Name);
    CHECK(target.children[1]->kind == AstNodeKind::IntLit);
    CHECK(assign.children[1]->kind == AstNodeKind::IntLit);
}

// -- Dead branches --

TEST_CASE("Optimizer removes decided if branches", "[optimizer]") {
    auto r = optimizeSource("if true { 1 } else { 2 }");
    const AstNode& kept = r.stmt(0);
    REQUIRE(kept.kind == AstNodeKind::Block);
    CHECK(kept.children[0]->intValue == 1);
    CHECK(r.stats.branchesRemoved == 1);

    r = optimizeSource("if 1 > 2 { 1 }");
    CHECK(r.stmt(0).kind == AstNodeKind::UnitLit);

    r = optimizeSource("if false { 1 } else if true { 2 } else { 3 }");
    REQUIRE(r.stmt(0).kind == AstNodeKind::Block);
    CHECK(r.stmt(0).children[0]->intValue == 2);
}

TEST_CASE("Optimizer selects the matching switch arm", "[optimizer]") {
    auto r = optimizeSource("switch 2 { 1 => \"a\", 2 | 3 => \"b\", _ => \"c\" }");
    REQUIRE(r.stmt(0).kind == AstNodeKind::StringLit);
    CHECK(r.stmt(0).stringValue == "b");

    r = optimizeSource("switch 9 { 1 => \"a\", _ => \"c\" }");
    REQUIRE(r.stmt(0).kind == AstNodeKind::StringLit);
    CHECK(r.stmt(0).stringValue == "c");

    r = optimizeSource("switch 9 { 1 => \"a\" }");
    CHECK(r.stmt(0).kind == AstNodeKind::UnitLit);

    // Patterns compare without numeric promotion
    r = optimizeSource("switch 1.0 { 1 => \"int\", _ => \"other\" }");
    CHECK(r.stmt(0).stringValue == "other");
}

TEST_CASE("Optimizer removes while false loops", "[optimizer]") {
    auto r = optimizeSource("while false { x = 1 }");
    CHECK(r.stmt(0).kind == AstNodeKind::UnitLit);
    CHECK(r.stats.branchesRemoved == 1);
}

// -- Pruning --

TEST_CASE("Optimizer prunes statements without effect", "[optimizer]") {
    auto r = optimizeSource("1; \"s\"; {}; let x = 1; x");
    REQUIRE(r.count() == 2);
    CHECK(r.stmt(0).kind == AstNodeKind::Let);
    CHECK(r.stmt(1).kind == AstNodeKind::Name);
    CHECK(r.stats.pruned == 3);
}

TEST_CASE("Optimizer keeps the last statement of a block", "[optimizer]") {
    auto r = optimizeSource("let v = { 1; 2 };");
    const AstNode& block = *r.stmt(0).children[0];
    REQUIRE(block.kind == AstNodeKind::Block);
    REQUIRE(block.children.size() == 1);
    CHECK(block.children[0]->intValue == 2);
}

// -- Native calls --

TEST_CASE("Optimizer folds pure native calls at full level", "[optimizer]") {
    FunctionRegistry registry;
    registry.registerNative("twice", {Value::Type::Int},
                            [](NativeCallContext&, std::vector<Value>& args) {
                                return Value::integer(args[0].asInt() * 2);
                            }, true);
    registry.registerNative("roll", {},
                            [](NativeCallContext&, std::vector<Value>&) {
                                return Value::integer(4);
                            });

    auto r = optimizeSource("twice(21)", OptimizationLevel::Full, nullptr, &registry);
    REQUIRE(r.stmt(0).kind == AstNodeKind::IntLit);
    CHECK(r.stmt(0).intValue == 42);
    CHECK(r.stats.callsFolded == 1);

    r = optimizeSource("roll()", OptimizationLevel::Full, nullptr, &registry);
    CHECK(r.stmt(0).kind == AstNodeKind::Call);

    r = optimizeSource("twice(21)", OptimizationLevel::Simple, nullptr, &registry);
    CHECK(r.stmt(0).kind == AstNodeKind::Call);

    r = optimizeSource("let n = 1; twice(n)", OptimizationLevel::Full, nullptr, &registry);
    CHECK(r.stmt(1).kind == AstNodeKind::Call);
}

TEST_CASE("Optimizer does not fold calls shadowed by script functions", "[optimizer]") {
    FunctionRegistry registry;
    registry.registerNative("twice", {Value::Type::Int},
                            [](NativeCallContext&, std::vector<Value>& args) {
                                return Value::integer(args[0].asInt() * 2);
                            }, true);

    auto r = optimizeSource("fn twice(x) { x } twice(21)", OptimizationLevel::Full, nullptr,
                            &registry);
    CHECK(r.stmt(1).kind == AstNodeKind::Call);
}

TEST_CASE("Optimizer keeps pure calls that fail", "[optimizer]") {
    FunctionRegistry registry;
    registry.registerNative("fail", {Value::Type::Int},
                            [](NativeCallContext&, std::vector<Value>&) -> Value {
                                throw std::runtime_error("nope");
                            }, true);

    auto r = optimizeSource("fail(1)", OptimizationLevel::Full, nullptr, &registry);
    CHECK(r.stmt(0).kind == AstNodeKind::Call);
    CHECK(r.stats.callsFolded == 0);
}

// -- Levels and equivalence --

TEST_CASE("Optimizer level None leaves the tree alone", "[optimizer]") {
    auto r = optimizeSource("1 + 2; if true { 3 }", OptimizationLevel::None);
    REQUIRE(r.count() == 2);
    CHECK(r.stmt(0).kind == AstNodeKind::Binary);
    CHECK(r.stmt(1).kind == AstNodeKind::If);
    CHECK(r.stats.folded == 0);
}

TEST_CASE("Optimized programs evaluate like unoptimized ones", "[optimizer]") {
    const char* programs[] = {
        "let x = 2 + 3 * 4; x",
        "const A = 3; let s = 0; for i in 0..A { s += i * 2 }; s",
        "if 1 < 2 { \"yes\" } else { \"no\" }",
        "switch 4 % 3 { 0 => 'a', 1 => 'b', _ => 'c' }",
        "let a = [1, 2, 3]; a[1] = 10 - 1; a",
        "fn f(n) { if n <= 1 { 1 } else { n * f(n - 1) } } f(5)",
        "const K = 2; let g = |x| x * K; g.call(4)",
        "let m = #{a: 1 + 1}; m.a ?? 0",
        "let n = 0; while false { n += 1 }; n",
    };
    for (const char* source : programs) {
        INFO(source);
        CHECK(run(source, OptimizationLevel::None) == run(source, OptimizationLevel::Simple));
    }
}

TEST_CASE("Optimized programs fail like unoptimized ones", "[optimizer]") {
    for (auto level : {OptimizationLevel::None, OptimizationLevel::Simple}) {
        try {
            run("let x = 1; x / 0", level);
            FAIL("expected DivisionByZero");
        } catch (const RuntimeError& e) {
            CHECK(e.kind() == RuntimeErrorKind::DivisionByZero);
        }
        CHECK_THROWS_AS(run("1 / 0", level), RuntimeError);
    }
}
