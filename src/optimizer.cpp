#include "kestrel/optimizer.h"
#include "kestrel/arithmetic.h"
#include "kestrel/error.h"
#include "kestrel/function_registry.h"
#include "kestrel/native_function.h"
#include "kestrel/scope.h"
#include <spdlog/spdlog.h>
#include <optional>
#include <unordered_set>

namespace kestrel {

namespace {

class Optimizer {
public:
    Optimizer(const Ast& ast, OptimizationLevel level, const FunctionRegistry* registry)
        : ast_(ast), level_(level), registry_(registry) {}

    OptimizerStats stats;

    /// Host constants form the outermost level of the top-level environment.
    void seed(const Scope& constants) {
        env_.emplace_back();
        for (auto& [name, value] : constants.constants()) {
            env_.back().emplace_back(name, value);
        }
    }

    void program(std::vector<std::unique_ptr<AstNode>>& statements) {
        env_.emplace_back();
        statementList(statements);
        env_.pop_back();
    }

private:
    // One level per block. A name bound to nullopt is a non-constant binding
    // that shadows anything outside it.
    using Level = std::vector<std::pair<std::string, std::optional<Value>>>;

    const Ast& ast_;
    OptimizationLevel level_;
    const FunctionRegistry* registry_;
    std::vector<Level> env_;
    std::unordered_set<const ScriptFunction*> visitedFunctions_;

    // -- Environment --

    void declare(const std::string& name, std::optional<Value> value) {
        env_.back().emplace_back(name, std::move(value));
    }

    std::optional<Value> constantValue(const std::string& name) const {
        for (auto level = env_.rbegin(); level != env_.rend(); ++level) {
            for (auto it = level->rbegin(); it != level->rend(); ++it) {
                if (it->first == name) return it->second;
            }
        }
        return std::nullopt;
    }

    class EnvLevel {
    public:
        explicit EnvLevel(std::vector<Level>& env) : env_(env) { env_.emplace_back(); }
        ~EnvLevel() { env_.pop_back(); }
    private:
        std::vector<Level>& env_;
    };

    // A function body sees only its own bindings.
    class FunctionEnv {
    public:
        explicit FunctionEnv(std::vector<Level>& env) : env_(env), saved_(std::move(env)) {
            env_.clear();
            env_.emplace_back();
        }
        ~FunctionEnv() { env_ = std::move(saved_); }
    private:
        std::vector<Level>& env_;
        std::vector<Level> saved_;
    };

    static void expectChildren(const AstNode& node, size_t count) {
        if (node.children.size() < count) {
            throw InternalError(std::string("malformed ") + astNodeKindName(node.kind) +
                                " node: expected " + std::to_string(count) +
                                " children, found " + std::to_string(node.children.size()));
        }
        for (size_t i = 0; i < count; i++) {
            if (!node.children[i]) {
                throw InternalError(std::string("malformed ") + astNodeKindName(node.kind) +
                                    " node: null child");
            }
        }
    }

    // -- Statements --

    void statementList(std::vector<std::unique_ptr<AstNode>>& statements) {
        for (auto& stmt : statements) {
            visit(stmt);
        }
        // Drop statements whose value is discarded and that do nothing
        std::vector<std::unique_ptr<AstNode>> kept;
        kept.reserve(statements.size());
        for (size_t i = 0; i < statements.size(); i++) {
            bool last = i + 1 == statements.size();
            if (!last && isNoOp(*statements[i])) {
                stats.pruned++;
                continue;
            }
            kept.push_back(std::move(statements[i]));
        }
        statements = std::move(kept);
    }

    static bool isNoOp(const AstNode& node) {
        if (node.isLiteral()) return true;
        return node.kind == AstNodeKind::Block && node.children.empty();
    }

    void visitFunction(ScriptFunction& fn) {
        // Function bodies are shared between clones; optimize each once
        if (!visitedFunctions_.insert(&fn).second) return;
        if (!fn.body) throw InternalError("function '" + fn.name + "' has no body");
        FunctionEnv scope(env_);
        for (auto& param : fn.params) declare(param, std::nullopt);
        visit(fn.body);
    }

    // -- Nodes --

    void visit(std::unique_ptr<AstNode>& slot) {
        if (!slot) throw InternalError("null AST node");
        AstNode& node = *slot;

        switch (node.kind) {
            case AstNodeKind::IntLit:
            case AstNodeKind::FloatLit:
            case AstNodeKind::StringLit:
            case AstNodeKind::CharLit:
            case AstNodeKind::BoolLit:
            case AstNodeKind::UnitLit:
            case AstNodeKind::Break:
            case AstNodeKind::Continue:
                return;

            case AstNodeKind::Name: {
                auto value = constantValue(node.stringValue);
                if (!value) return;
                if (auto literal = makeLiteral(*value, node.loc)) {
                    slot = std::move(literal);
                    stats.propagated++;
                }
                return;
            }

            case AstNodeKind::ArrayLit:
            case AstNodeKind::MapLit:
            case AstNodeKind::Call:
            case AstNodeKind::MethodCall:
            case AstNodeKind::Index:
            case AstNodeKind::Property:
            case AstNodeKind::Range:
            case AstNodeKind::Return:
                for (auto& child : node.children) visit(child);
                if (node.kind == AstNodeKind::Call) foldCall(slot);
                return;

            case AstNodeKind::Unary: {
                expectChildren(node, 1);
                visit(node.children[0]);
                if (!node.children[0]->isLiteral()) return;
                try {
                    auto result = applyUnary(node.op, literalValue(*node.children[0]));
                    if (result) replaceWithLiteral(slot, *result, stats.folded);
                } catch (const RuntimeError&) {
                    // Leave the failing operation for the evaluator to report
                }
                return;
            }

            case AstNodeKind::Binary: {
                expectChildren(node, 2);
                visit(node.children[0]);
                visit(node.children[1]);
                if (!node.children[0]->isLiteral() || !node.children[1]->isLiteral()) return;
                try {
                    auto result = applyBinary(node.op, literalValue(*node.children[0]),
                                              literalValue(*node.children[1]));
                    if (result) replaceWithLiteral(slot, *result, stats.folded);
                } catch (const RuntimeError&) {
                    // Leave the failing operation for the evaluator to report
                }
                return;
            }

            case AstNodeKind::And:
            case AstNodeKind::Or: {
                expectChildren(node, 2);
                visit(node.children[0]);
                visit(node.children[1]);
                const AstNode& left = *node.children[0];
                if (left.kind != AstNodeKind::BoolLit) return;
                bool isAnd = node.kind == AstNodeKind::And;
                if (left.boolValue != isAnd) {
                    // Short-circuits: the right side never runs
                    slot = std::move(node.children[0]);
                    stats.folded++;
                } else if (node.children[1]->kind == AstNodeKind::BoolLit) {
                    slot = std::move(node.children[1]);
                    stats.folded++;
                }
                return;
            }

            case AstNodeKind::Coalesce: {
                expectChildren(node, 2);
                visit(node.children[0]);
                visit(node.children[1]);
                const AstNode& left = *node.children[0];
                if (!left.isLiteral()) return;
                slot = left.kind == AstNodeKind::UnitLit ? std::move(node.children[1])
                                                         : std::move(node.children[0]);
                stats.folded++;
                return;
            }

            case AstNodeKind::Assign:
                expectChildren(node, 2);
                visitTarget(*node.children[0]);
                visit(node.children[1]);
                return;

            case AstNodeKind::Closure:
                if (!node.function) throw InternalError("closure node without a function");
                visitFunction(*node.function);
                return;

            case AstNodeKind::FnDef:
                if (!node.function) throw InternalError("fn node without a function");
                visitFunction(*node.function);
                return;

            case AstNodeKind::Block: {
                EnvLevel level(env_);
                statementList(node.children);
                return;
            }

            case AstNodeKind::If:
                visitIf(slot);
                return;

            case AstNodeKind::Switch:
                visitSwitch(slot);
                return;

            case AstNodeKind::While:
                expectChildren(node, 2);
                visit(node.children[0]);
                if (node.children[0]->kind == AstNodeKind::BoolLit &&
                    !node.children[0]->boolValue) {
                    slot = makeUnitLit(node.loc);
                    stats.branchesRemoved++;
                    return;
                }
                visit(node.children[1]);
                return;

            case AstNodeKind::DoWhile:
                expectChildren(node, 2);
                visit(node.children[0]);
                visit(node.children[1]);
                return;

            case AstNodeKind::Loop:
                expectChildren(node, 1);
                visit(node.children[0]);
                return;

            case AstNodeKind::For: {
                expectChildren(node, 2);
                if (node.nameParts.empty()) throw InternalError("for loop without a variable");
                visit(node.children[0]);
                EnvLevel level(env_);
                for (auto& var : node.nameParts) declare(var, std::nullopt);
                visit(node.children[1]);
                return;
            }

            case AstNodeKind::Let: {
                if (node.nameParts.empty()) throw InternalError("let without a name");
                if (!node.children.empty()) visit(node.children[0]);
                std::optional<Value> value;
                if (node.boolValue && !node.children.empty() && node.children[0]->isLiteral()) {
                    value = literalValue(*node.children[0]);
                }
                declare(node.nameParts[0], std::move(value));
                return;
            }
        }
        throw InternalError(std::string("unknown AST node kind in optimizer: ") +
                            astNodeKindName(node.kind));
    }

    // Index expressions inside an assignment target are ordinary expressions;
    // the variable at its root must stay a name.
    void visitTarget(AstNode& target) {
        switch (target.kind) {
            case AstNodeKind::Name:
                return;
            case AstNodeKind::Index:
                expectChildren(target, 2);
                visitTarget(*target.children[0]);
                visit(target.children[1]);
                return;
            case AstNodeKind::Property:
                expectChildren(target, 1);
                visitTarget(*target.children[0]);
                return;
            default:
                throw InternalError(std::string("invalid assignment target: ") +
                                    astNodeKindName(target.kind));
        }
    }

    void visitIf(std::unique_ptr<AstNode>& slot) {
        AstNode& node = *slot;
        expectChildren(node, node.hasElse ? 3 : 2);
        for (auto& child : node.children) visit(child);

        const AstNode& cond = *node.children[0];
        if (cond.kind != AstNodeKind::BoolLit) return;
        stats.branchesRemoved++;
        if (cond.boolValue) {
            slot = std::move(node.children[1]);
        } else if (node.hasElse) {
            slot = std::move(node.children[2]);
        } else {
            slot = makeUnitLit(node.loc);
        }
    }

    void visitSwitch(std::unique_ptr<AstNode>& slot) {
        AstNode& node = *slot;
        expectChildren(node, 1);
        size_t armsEnd = node.children.size() - (node.hasElse ? 1 : 0);
        if (armsEnd % 2 != 1) throw InternalError("switch arms are not pattern/body pairs");

        visit(node.children[0]);
        for (size_t i = 2; i < armsEnd; i += 2) visit(node.children[i]);
        if (node.hasElse) visit(node.children.back());

        const AstNode& scrutinee = *node.children[0];
        if (!scrutinee.isLiteral()) return;
        Value value = literalValue(scrutinee);

        stats.branchesRemoved++;
        for (size_t i = 1; i + 1 < armsEnd; i += 2) {
            for (auto& pattern : node.children[i]->children) {
                if (literalValue(*pattern) == value) {
                    slot = std::move(node.children[i + 1]);
                    return;
                }
            }
        }
        if (node.hasElse) {
            slot = std::move(node.children.back());
        } else {
            slot = makeUnitLit(node.loc);
        }
    }

    // -- Folding --

    void replaceWithLiteral(std::unique_ptr<AstNode>& slot, const Value& value, size_t& counter) {
        if (auto literal = makeLiteral(value, slot->loc)) {
            slot = std::move(literal);
            counter++;
        }
    }

    void foldCall(std::unique_ptr<AstNode>& slot) {
        if (level_ != OptimizationLevel::Full || !registry_) return;
        AstNode& node = *slot;
        // Script functions shadow host functions of the same name
        if (ast_.library().contains(node.stringValue)) return;

        std::vector<Value> args;
        for (auto& arg : node.children) {
            if (!arg->isLiteral()) return;
            args.push_back(literalValue(*arg));
        }

        try {
            const FunctionEntry* entry = registry_->find(node.stringValue, args, node.loc);
            if (!entry || !entry->isNative() || !entry->pure) return;
            NativeCallContext ctx(nullptr, node.stringValue, node.loc);
            Value result = entry->native->call(ctx, args);
            replaceWithLiteral(slot, result, stats.callsFolded);
        } catch (const InternalError&) {
            throw;
        } catch (const std::exception& e) {
            // The call fails the same way at runtime; keep it
            spdlog::debug("kestrel: not folding {}(): {}", node.stringValue, e.what());
        }
    }
};

} // anonymous namespace

OptimizerStats optimize(Ast& ast, OptimizationLevel level, const Scope* constants,
                        const FunctionRegistry* registry) {
    if (level == OptimizationLevel::None) return {};

    Optimizer opt(ast, level, registry);
    if (constants) opt.seed(*constants);
    opt.program(ast.statements());

    spdlog::debug("kestrel: optimizer folded {} expressions, propagated {} constants, "
                  "removed {} branches, pruned {} statements, folded {} calls",
                  opt.stats.folded, opt.stats.propagated, opt.stats.branchesRemoved,
                  opt.stats.pruned, opt.stats.callsFolded);
    return opt.stats;
}

} // namespace kestrel
