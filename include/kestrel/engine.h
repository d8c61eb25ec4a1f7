#pragma once

#include "ast.h"
#include "dialect.h"
#include "error.h"
#include "function_registry.h"
#include "native_function.h"
#include "scope.h"
#include "value.h"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kestrel {

// -- Free-function API --

/// Tokenize, parse and optimize (per dialect.optimization_level). `registry`
/// enables folding of pure natives at OptimizationLevel::Full; `constants`
/// supplies host constants to propagate. Throws LexError or ParseError.
std::shared_ptr<Ast> compile(std::string_view source, const DialectConfig& dialect = {},
                             const FunctionRegistry* registry = nullptr,
                             const Scope* constants = nullptr);

/// Run a compiled program against `scope`. Top-level bindings stay in the
/// scope afterwards. Throws RuntimeError.
Value evaluate(const Ast& ast, Scope& scope, const FunctionRegistry& registry,
               EvalOptions options = {});

/// Result of Engine::execute. Never carries an exception.
struct ExecResult {
    bool success = true;
    Value value;
    std::string error;
    int errorLine = 0;
    int errorColumn = 0;
};

/// Convenience owner of a dialect and a function registry.
class Engine {
public:
    explicit Engine(DialectConfig dialect = {});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    const DialectConfig& dialect() const;
    FunctionRegistry& registry();
    const FunctionRegistry& registry() const;

    // Compilation
    std::shared_ptr<Ast> compile(std::string_view source, const Scope* constants = nullptr) const;
    /// Compile a single expression; statements are rejected.
    std::shared_ptr<Ast> compileExpression(std::string_view source) const;

    // Execution
    Value evaluate(const Ast& ast, Scope& scope, EvalOptions options = {}) const;
    Value eval(std::string_view source, Scope& scope) const;
    ExecResult execute(const Ast& ast, Scope& scope, EvalOptions options = {}) const;
    /// Compile and execute; compile errors are reported in the result too.
    ExecResult executeCommand(std::string_view source, Scope& scope) const;

    /// Call a function by name the way a script in `ast` would.
    Value callFn(const Ast& ast, const std::string& name, std::vector<Value> args) const;

    /// Call a function pointer returned by a script.
    Value callFunction(const Value& fn, std::vector<Value> args) const;

    // Registration
    /// Untyped and variadic: receives every argument.
    void registerFunction(const std::string& name, SimpleLambdaFunction::Func fn);
    void registerFunction(FunctionSignature sig, SimpleLambdaFunction::Func fn, bool pure = false);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kestrel
