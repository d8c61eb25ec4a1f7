#include <catch2/catch_test_macros.hpp>
#include "kestrel/kestrel.h"

#include <atomic>

using namespace kestrel;

using T = Value::Type;

// Helper: execute a command string and return the result
static ExecResult run(Engine& engine, Scope& scope, std::string_view code) {
    return engine.executeCommand(code, scope);
}

// === Basic pipeline ===

TEST_CASE("Integration: compile and execute a simple expression", "[integration]") {
    Engine engine;
    Scope scope;

    auto result = run(engine, scope, "1 + 2");
    CHECK(result.success);
    CHECK(result.value.asInt() == 3);
    CHECK(result.error.empty());
}

TEST_CASE("Integration: bindings persist in the scope between commands", "[integration]") {
    Engine engine;
    Scope scope;

    CHECK(run(engine, scope, "let x = 10;").success);
    auto result = run(engine, scope, "let y = 20; x + y");
    CHECK(result.success);
    CHECK(result.value.asInt() == 30);
    CHECK(scope.get("y")->asInt() == 20);
}

TEST_CASE("Integration: scopes are independent", "[integration]") {
    Engine engine;
    Scope first;
    Scope second;

    run(engine, first, "let x = 1;");
    auto result = run(engine, second, "x");
    CHECK_FALSE(result.success);
    CHECK(result.error.find("Undefined variable") != std::string::npos);
}

TEST_CASE("Integration: a compiled program can run many times", "[integration]") {
    Engine engine;
    auto ast = engine.compile("let doubled = input * 2; doubled");

    Scope a;
    a.define("input", Value::integer(4));
    Scope b;
    b.define("input", Value::integer(21));

    CHECK(engine.evaluate(*ast, a).asInt() == 8);
    CHECK(engine.evaluate(*ast, b).asInt() == 42);
    CHECK(engine.evaluate(*ast, a).asInt() == 8);
}

// === Native function registration ===

TEST_CASE("Integration: register a variadic native function", "[integration]") {
    Engine engine;
    engine.registerFunction("sum", [](NativeCallContext&, std::vector<Value>& args) {
        int64_t total = 0;
        for (auto& a : args) total += a.asInt();
        return Value::integer(total);
    });
    Scope scope;

    CHECK(engine.eval("sum(1, 2, 3)", scope).asInt() == 6);
    CHECK(engine.eval("sum()", scope).asInt() == 0);
    CHECK(engine.registry().contains("sum"));
}

TEST_CASE("Integration: typed overloads", "[integration]") {
    Engine engine;
    engine.registerFunction(FunctionSignature("half", {T::Int}),
                            [](NativeCallContext&, std::vector<Value>& args) {
                                return Value::integer(args[0].asInt() / 2);
                            });
    engine.registerFunction(FunctionSignature("half", {T::Float}),
                            [](NativeCallContext&, std::vector<Value>& args) {
                                return Value::number(args[0].asFloat() / 2);
                            });
    Scope scope;

    auto i = engine.eval("half(5)", scope);
    REQUIRE(i.isInt());
    CHECK(i.asInt() == 2);
    auto f = engine.eval("half(5.0)", scope);
    REQUIRE(f.isFloat());
    CHECK(f.asFloat() == 2.5);

    auto result = run(engine, scope, "half(\"x\")");
    CHECK_FALSE(result.success);
    CHECK(result.error.find("half") != std::string::npos);
}

TEST_CASE("Integration: native methods mutate their receiver", "[integration]") {
    Engine engine;
    engine.registerFunction(FunctionSignature("push", {T::Array, std::nullopt}),
                            [](NativeCallContext&, std::vector<Value>& args) {
                                args[0].asArrayMut().push_back(args[1]);
                                return Value::unit();
                            });
    Scope scope;

    auto v = engine.eval("let a = []; a.push(1); a.push(\"two\"); a", scope);
    REQUIRE(v.isArray());
    CHECK(v.asArray().size() == 2);
    CHECK(v.toString() == "[1, \"two\"]");
}

TEST_CASE("Integration: pure natives fold at full optimization", "[integration]") {
    DialectConfig dialect;
    dialect.optimization_level = OptimizationLevel::Full;
    Engine engine(dialect);
    int calls = 0;
    engine.registerFunction(FunctionSignature("square", {T::Int}),
                            [&calls](NativeCallContext&, std::vector<Value>& args) {
                                calls++;
                                return Value::integer(args[0].asInt() * args[0].asInt());
                            },
                            true);

    auto ast = engine.compile("square(4)");
    REQUIRE(ast->statements().size() == 1);
    CHECK(ast->statements()[0]->kind == AstNodeKind::IntLit);
    CHECK(calls == 1);

    Scope scope;
    CHECK(engine.evaluate(*ast, scope).asInt() == 16);
    CHECK(calls == 1);
}

TEST_CASE("Integration: host constants propagate at compile time", "[integration]") {
    Engine engine;
    Scope scope;
    scope.defineConstant("LIMIT", Value::integer(10));

    auto ast = engine.compile("let twice = LIMIT * 2; twice", &scope);
    const AstNode& let = *ast->statements()[0];
    REQUIRE(let.children.size() == 1);
    CHECK(let.children[0]->kind == AstNodeKind::IntLit);
    CHECK(engine.evaluate(*ast, scope).asInt() == 20);
}

// === Errors ===

TEST_CASE("Integration: compile errors are reported with a position", "[integration]") {
    Engine engine;
    Scope scope;

    auto result = run(engine, scope, "let s = \"abc");
    CHECK_FALSE(result.success);
    CHECK(result.errorLine == 1);
    CHECK(result.errorColumn == 9);
    CHECK_FALSE(result.error.empty());

    CHECK_THROWS_AS(engine.compile("let = 1"), ParseError);
    CHECK_THROWS_AS(engine.compile("\"abc"), LexError);
    CHECK_THROWS_AS(engine.compile("let = 1"), CompileError);
}

TEST_CASE("Integration: runtime errors are reported with a position", "[integration]") {
    Engine engine;
    Scope scope;

    auto result = run(engine, scope, "let a = 1;\nlet b = a / 0;");
    CHECK_FALSE(result.success);
    CHECK(result.errorLine == 2);
    CHECK(result.errorColumn == 11);
    CHECK(result.error.find("Division by zero") != std::string::npos);
    // Bindings made before the failure stay
    CHECK(scope.contains("a"));
    CHECK_FALSE(scope.contains("b"));
}

TEST_CASE("Integration: evaluate throws, execute does not", "[integration]") {
    Engine engine;
    Scope scope;
    auto ast = engine.compile("missing(1, 2)");

    try {
        engine.evaluate(*ast, scope);
        FAIL("expected RuntimeError");
    } catch (const RuntimeError& e) {
        CHECK(e.kind() == RuntimeErrorKind::FunctionNotFound);
        CHECK(e.name() == "missing");
        CHECK(e.arity() == 2);
    }

    ExecResult result;
    CHECK_NOTHROW(result = engine.execute(*ast, scope));
    CHECK_FALSE(result.success);
}

TEST_CASE("Integration: dialect restrictions", "[integration]") {
    DialectConfig dialect;
    dialect.allow_closures = false;
    Engine engine(dialect);
    Scope scope;

    auto result = run(engine, scope, "let f = |x| x;");
    CHECK_FALSE(result.success);
    CHECK(result.errorLine == 1);
    CHECK(result.errorColumn == 9);
    CHECK_FALSE(engine.dialect().allow_closures);
}

// === Limits ===

TEST_CASE("Integration: runaway scripts are stopped", "[integration]") {
    DialectConfig dialect;
    dialect.max_operations = 1000;
    Engine engine(dialect);
    Scope scope;

    auto result = run(engine, scope, "let n = 0; loop { n += 1 }");
    CHECK_FALSE(result.success);
    CHECK(result.error.find("Operation limit") != std::string::npos);
    CHECK(scope.get("n")->asInt() > 0);
}

TEST_CASE("Integration: host interruption", "[integration]") {
    Engine engine;
    Scope scope;
    std::atomic<bool> stop{true};
    EvalOptions options;
    options.interruptFlag = &stop;

    auto ast = engine.compile("let x = 1; x");
    auto result = engine.execute(*ast, scope, options);
    CHECK_FALSE(result.success);
    CHECK(result.error.find("interrupted") != std::string::npos);

    stop = false;
    result = engine.execute(*ast, scope, options);
    CHECK(result.success);
    CHECK(result.value.asInt() == 1);
}

// === Calling into scripts ===

TEST_CASE("Integration: call a script function by name", "[integration]") {
    Engine engine;
    engine.registerFunction(FunctionSignature("shout", {T::String}),
                            [](NativeCallContext&, std::vector<Value>& args) {
                                return Value::string(args[0].asString() + "!");
                            });
    auto ast = engine.compile(
        "fn add(a, b) { a + b }\n"
        "fn greet(name) { shout(\"hi \" + name) }\n");

    CHECK(engine.callFn(*ast, "add", {Value::integer(1), Value::integer(2)}).asInt() == 3);
    CHECK(engine.callFn(*ast, "greet", {Value::string("bob")}).asString() == "hi bob!");
    CHECK(engine.callFn(*ast, "shout", {Value::string("hey")}).asString() == "hey!");

    try {
        engine.callFn(*ast, "add", {Value::integer(1)});
        FAIL("expected RuntimeError");
    } catch (const RuntimeError& e) {
        CHECK(e.kind() == RuntimeErrorKind::FunctionNotFound);
        CHECK(e.arity() == 1);
    }
    CHECK_THROWS_AS(engine.callFn(*ast, "nope", {}), RuntimeError);
}

TEST_CASE("Integration: call a closure returned by a script", "[integration]") {
    Engine engine;
    Scope scope;

    auto fn = engine.eval("let k = 3; |x| x * k", scope);
    REQUIRE(fn.isFnPtr());
    CHECK(engine.callFunction(fn, {Value::integer(5)}).asInt() == 15);

    // The closure shares `k` with the scope it was created in
    engine.eval("k = 100;", scope);
    CHECK(engine.callFunction(fn, {Value::integer(1)}).asInt() == 100);
    CHECK(scope.isShared("k"));

    try {
        engine.callFunction(Value::integer(1), {});
        FAIL("expected RuntimeError");
    } catch (const RuntimeError& e) {
        CHECK(e.kind() == RuntimeErrorKind::TypeMismatch);
    }
}

TEST_CASE("Integration: compile a single expression", "[integration]") {
    Engine engine;
    Scope scope;
    scope.define("x", Value::integer(2));

    auto ast = engine.compileExpression("1 + 2 * x");
    CHECK(engine.evaluate(*ast, scope).asInt() == 5);

    CHECK_THROWS_AS(engine.compileExpression("let y = 1"), ParseError);
    CHECK_THROWS_AS(engine.compileExpression("1; 2"), ParseError);
}

TEST_CASE("Integration: host objects travel through scripts", "[integration]") {
    class Handle : public HostObject {
    public:
        explicit Handle(int id) : id(id) {}
        std::string typeName() const override { return "Handle"; }
        int id;
    };

    Engine engine;
    engine.registerFunction(FunctionSignature("get$id", {T::Custom}),
                            [](NativeCallContext&, std::vector<Value>& args) {
                                return Value::integer(args[0].customAs<Handle>()->id);
                            });
    Scope scope;
    auto handle = std::make_shared<Handle>(7);
    scope.define("h", Value::custom(handle));

    auto v = engine.eval("let list = [h, h]; list[1]", scope);
    CHECK(v.customAs<Handle>() == handle.get());
    CHECK(engine.eval("h.id + 1", scope).asInt() == 8);
    CHECK(engine.eval("h == list[0]", scope).asBool());
}
