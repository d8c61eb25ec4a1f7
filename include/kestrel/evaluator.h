#pragma once

#include "dialect.h"
#include "error.h"
#include "function_registry.h"
#include "scope.h"
#include "source_location.h"
#include "value.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kestrel {

struct AstNode;
struct ScriptFunction;

enum class FlowKind { Normal, Return, Break, Continue };

/// Result of evaluating any node: a value plus the control-flow signal that
/// is still unwinding. Return stops at the enclosing call, Break/Continue at
/// the enclosing loop.
struct Flow {
    FlowKind kind = FlowKind::Normal;
    Value value;
    SourceLocation loc;  // where a non-normal signal was raised

    static Flow normal(Value v) { return {FlowKind::Normal, std::move(v), {}}; }
    bool isNormal() const { return kind == FlowKind::Normal; }
};

/// Tree-walking evaluator. One instance serves one evaluation against one
/// Scope; it is not reentrant across threads.
class Evaluator {
public:
    /// `library` holds the script functions of the Ast being run (may be null);
    /// it is consulted before the host registry.
    Evaluator(Scope& scope, const FunctionRegistry& registry, const DialectConfig& dialect,
              const FunctionRegistry* library = nullptr, EvalOptions options = {});

    /// Run top-level statements directly in the scope, so `let` bindings persist.
    Value run(const std::vector<std::unique_ptr<AstNode>>& statements);

    Flow eval(const AstNode& node);

    /// Call a function pointer (closure or named function).
    Value callFunction(const Value& fn, std::vector<Value> args, SourceLocation callSite);

    /// Resolve a function by name the way a script call does, and call it.
    Value callByName(const std::string& name, std::vector<Value> args, SourceLocation callSite);

    uint64_t operations() const { return operations_; }

private:
    Scope& scope_;
    const FunctionRegistry& registry_;
    const FunctionRegistry* library_;
    DialectConfig dialect_;
    EvalOptions options_;

    uint64_t operations_ = 0;
    size_t callDepth_ = 0;

    // A step in an assignment path: a[i], m.key
    struct Accessor {
        bool isProperty;
        Value key;  // index value, or property name as a string
        SourceLocation loc;
    };

    Flow evalArrayLit(const AstNode& node);
    Flow evalMapLit(const AstNode& node);
    Flow evalName(const AstNode& node);
    Flow evalUnary(const AstNode& node);
    Flow evalBinary(const AstNode& node);
    Flow evalLogical(const AstNode& node);
    Flow evalCoalesce(const AstNode& node);
    Flow evalRange(const AstNode& node);
    Flow evalAssign(const AstNode& node);
    Flow evalIndex(const AstNode& node);
    Flow evalProperty(const AstNode& node);
    Flow evalCall(const AstNode& node);
    Flow evalMethodCall(const AstNode& node);
    Flow evalClosure(const AstNode& node);
    Flow evalBlock(const AstNode& node);
    Flow evalIf(const AstNode& node);
    Flow evalSwitch(const AstNode& node);
    Flow evalWhile(const AstNode& node);
    Flow evalDoWhile(const AstNode& node);
    Flow evalLoop(const AstNode& node);
    Flow evalFor(const AstNode& node);
    Flow evalLet(const AstNode& node);
    Flow evalReturn(const AstNode& node);

    // Evaluate children [from, end) left to right into `out`; a non-normal
    // flow stops evaluation and is returned through `signal`.
    bool evalArgs(const AstNode& node, size_t from, std::vector<Value>& out, Flow& signal);

    // Place resolution for assignment targets
    bool collectPath(const AstNode& target, std::string& root, std::vector<Accessor>& path,
                     Flow& signal);
    Value assignPath(Value& container, const std::vector<Accessor>& path, size_t i,
                     const std::string& op, const Value& rhs, SourceLocation loc);
    Value readPlace(const std::string& root, const std::vector<Accessor>& path,
                    SourceLocation loc);
    Value updatePlace(const std::string& root, const std::vector<Accessor>& path,
                      const std::string& op, const Value& rhs, SourceLocation loc);
    bool isWritablePlace(const AstNode& target) const;
    Value accessorCall(const std::string& name, std::vector<Value>& args, RuntimeErrorKind missing,
                       const std::string& message, SourceLocation loc);

    Value indexValue(const Value& target, const Value& index, SourceLocation loc);
    Value propertyValue(const Value& target, const std::string& name, SourceLocation loc);
    Value applyOperator(const std::string& op, const Value& left, const Value& right,
                        SourceLocation loc);
    bool conditionValue(const Value& v, const char* what, SourceLocation loc) const;

    const FunctionEntry* findFunction(const std::string& name, const std::vector<Value>& args,
                                      SourceLocation loc) const;
    Value invoke(const FunctionEntry& entry, const std::string& name, std::vector<Value>& args,
                 SourceLocation loc);
    Value callScript(const ScriptFunction& fn,
                     const std::vector<Capture>& captures,
                     std::vector<Value> args, SourceLocation loc);

    void tick(SourceLocation loc);
    void checkSize(const Value& v, SourceLocation loc) const;
};

} // namespace kestrel
