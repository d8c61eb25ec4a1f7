#include "kestrel/engine.h"
#include "kestrel/evaluator.h"
#include "kestrel/optimizer.h"
#include "kestrel/parser.h"
#include <spdlog/spdlog.h>

namespace kestrel {

// -- Free functions --

std::shared_ptr<Ast> compile(std::string_view source, const DialectConfig& dialect,
                             const FunctionRegistry* registry, const Scope* constants) {
    auto ast = Parser::parse(source, dialect);
    optimize(*ast, dialect.optimization_level, constants, registry);
    spdlog::debug("kestrel: compiled {} statement(s), {} script function(s)",
                  ast->statements().size(), ast->library().size());
    return ast;
}

Value evaluate(const Ast& ast, Scope& scope, const FunctionRegistry& registry,
               EvalOptions options) {
    Evaluator evaluator(scope, registry, ast.dialect(), &ast.library(), std::move(options));
    return evaluator.run(ast.statements());
}

// -- Engine --

struct Engine::Impl {
    DialectConfig dialect;
    FunctionRegistry registry;

    explicit Impl(DialectConfig d) : dialect(d) {}
};

Engine::Engine(DialectConfig dialect) : impl_(std::make_unique<Impl>(dialect)) {}

Engine::~Engine() = default;

const DialectConfig& Engine::dialect() const { return impl_->dialect; }
FunctionRegistry& Engine::registry() { return impl_->registry; }
const FunctionRegistry& Engine::registry() const { return impl_->registry; }

std::shared_ptr<Ast> Engine::compile(std::string_view source, const Scope* constants) const {
    return kestrel::compile(source, impl_->dialect, &impl_->registry, constants);
}

std::shared_ptr<Ast> Engine::compileExpression(std::string_view source) const {
    std::vector<std::unique_ptr<AstNode>> statements;
    statements.push_back(Parser::parseExpression(source, impl_->dialect));
    auto ast = std::make_shared<Ast>(std::move(statements), impl_->dialect);
    optimize(*ast, impl_->dialect.optimization_level, nullptr, &impl_->registry);
    return ast;
}

Value Engine::evaluate(const Ast& ast, Scope& scope, EvalOptions options) const {
    return kestrel::evaluate(ast, scope, impl_->registry, std::move(options));
}

Value Engine::eval(std::string_view source, Scope& scope) const {
    auto ast = compile(source);
    return evaluate(*ast, scope);
}

ExecResult Engine::execute(const Ast& ast, Scope& scope, EvalOptions options) const {
    ExecResult result;
    try {
        result.value = evaluate(ast, scope, std::move(options));
        result.success = true;
    } catch (const RuntimeError& e) {
        if (e.kind() == RuntimeErrorKind::ResourceLimitExceeded ||
            e.kind() == RuntimeErrorKind::ExecutionInterrupted) {
            spdlog::warn("kestrel: script stopped: {}", e.what());
        }
        result.success = false;
        result.error = e.what();
        result.errorLine = static_cast<int>(e.location().line);
        result.errorColumn = static_cast<int>(e.location().column);
    } catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
    }
    return result;
}

ExecResult Engine::executeCommand(std::string_view source, Scope& scope) const {
    std::shared_ptr<Ast> ast;
    try {
        ast = compile(source);
    } catch (const CompileError& e) {
        ExecResult result;
        result.success = false;
        result.error = e.what();
        result.errorLine = static_cast<int>(e.location().line);
        result.errorColumn = static_cast<int>(e.location().column);
        return result;
    }
    return execute(*ast, scope);
}

Value Engine::callFn(const Ast& ast, const std::string& name, std::vector<Value> args) const {
    Scope scope;
    Evaluator evaluator(scope, impl_->registry, ast.dialect(), &ast.library());
    return evaluator.callByName(name, std::move(args), SourceLocation{});
}

Value Engine::callFunction(const Value& fn, std::vector<Value> args) const {
    Scope scope;
    Evaluator evaluator(scope, impl_->registry, impl_->dialect);
    return evaluator.callFunction(fn, std::move(args), SourceLocation{});
}

void Engine::registerFunction(const std::string& name, SimpleLambdaFunction::Func fn) {
    impl_->registry.registerFunction(FunctionSignature(name, {}, true),
                                     std::make_shared<SimpleLambdaFunction>(std::move(fn)));
}

void Engine::registerFunction(FunctionSignature sig, SimpleLambdaFunction::Func fn, bool pure) {
    impl_->registry.registerFunction(std::move(sig),
                                     std::make_shared<SimpleLambdaFunction>(std::move(fn)), pure);
}

} // namespace kestrel
