#pragma once

#include "dialect.h"
#include "function_registry.h"
#include "source_location.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kestrel {

enum class AstNodeKind {
    IntLit,
    FloatLit,
    StringLit,
    CharLit,
    BoolLit,
    UnitLit,
    ArrayLit,
    MapLit,
    Name,
    Unary,
    Binary,
    And,
    Or,
    Coalesce,
    Range,
    Assign,
    Index,
    Property,
    Call,
    MethodCall,
    Closure,
    Block,
    If,
    Switch,
    While,
    DoWhile,
    Loop,
    For,
    Let,
    FnDef,
    Return,
    Break,
    Continue,
};

const char* astNodeKindName(AstNodeKind kind);

struct AstNode;

/// A script-defined function: a `fn` definition or an anonymous closure.
/// Shared between the defining node, the Ast's library and any function
/// pointers created from it, so it outlives the Ast when a closure escapes.
struct ScriptFunction {
    std::string name;
    std::vector<std::string> params;
    // Free names of the body, resolved against the enclosing scope when the
    // closure is created. Always empty for `fn` definitions.
    std::vector<std::string> captures;
    std::unique_ptr<AstNode> body;
    SourceLocation loc;
};

/// Node layout by kind:
///   IntLit/FloatLit/StringLit/CharLit/BoolLit  payload field
///   ArrayLit     children = elements
///   MapLit       nameParts = keys, children = values
///   Name         stringValue = identifier
///   Unary        op, children[0]
///   Binary       op, children[0..1]
///   And/Or/Coalesce  children[0..1]
///   Range        boolValue = inclusive, children[0..1]
///   Assign       op ("=", "+=", ...), children[0] = target, children[1] = value
///   Index        children[0] = target, children[1] = index
///   Property     stringValue = field, children[0] = target
///   Call         stringValue = function name, children = args
///   MethodCall   stringValue = method name, children[0] = receiver, rest = args
///   Closure      function
///   Block        children = statements
///   If           children = [cond, then, else?], hasElse
///   Switch       children[0] = scrutinee, then (ArrayLit of patterns, body) pairs,
///                then the default body when hasElse
///   While        children = [cond, body]
///   DoWhile      children = [body, cond], boolValue = `until`
///   Loop         children = [body]
///   For          nameParts = [var] or [var, counter], children = [iterable, body]
///   Let          nameParts[0] = name, boolValue = const, children = [init?]
///   FnDef        stringValue = name, function
///   Return       children = [value?]
struct AstNode {
    AstNodeKind kind;
    SourceLocation loc;

    int64_t intValue = 0;
    double floatValue = 0.0;
    std::string stringValue;
    uint32_t charValue = 0;
    bool boolValue = false;
    bool hasElse = false;

    std::vector<std::unique_ptr<AstNode>> children;
    std::string op;
    std::vector<std::string> nameParts;

    std::shared_ptr<ScriptFunction> function;

    bool isLiteral() const;
};

/// A compiled program: top-level statements, the script functions they
/// define, and the dialect the source was compiled under.
class Ast {
public:
    Ast(std::vector<std::unique_ptr<AstNode>> statements, DialectConfig dialect)
        : statements_(std::move(statements)), dialect_(dialect) {}

    const std::vector<std::unique_ptr<AstNode>>& statements() const { return statements_; }
    std::vector<std::unique_ptr<AstNode>>& statements() { return statements_; }

    const FunctionRegistry& library() const { return library_; }
    FunctionRegistry& library() { return library_; }

    const DialectConfig& dialect() const { return dialect_; }

private:
    std::vector<std::unique_ptr<AstNode>> statements_;
    FunctionRegistry library_;
    DialectConfig dialect_;
};

// Factory functions
std::unique_ptr<AstNode> makeIntLit(int64_t val, SourceLocation loc);
std::unique_ptr<AstNode> makeFloatLit(double val, SourceLocation loc);
std::unique_ptr<AstNode> makeStringLit(std::string val, SourceLocation loc);
std::unique_ptr<AstNode> makeCharLit(uint32_t val, SourceLocation loc);
std::unique_ptr<AstNode> makeBoolLit(bool val, SourceLocation loc);
std::unique_ptr<AstNode> makeUnitLit(SourceLocation loc);
std::unique_ptr<AstNode> makeArrayLit(std::vector<std::unique_ptr<AstNode>> elems, SourceLocation loc);
std::unique_ptr<AstNode> makeMapLit(std::vector<std::string> keys, std::vector<std::unique_ptr<AstNode>> values, SourceLocation loc);
std::unique_ptr<AstNode> makeName(std::string name, SourceLocation loc);
std::unique_ptr<AstNode> makeUnary(std::string op, std::unique_ptr<AstNode> operand, SourceLocation loc);
std::unique_ptr<AstNode> makeBinary(std::string op, std::unique_ptr<AstNode> left, std::unique_ptr<AstNode> right, SourceLocation loc);
std::unique_ptr<AstNode> makeLogical(AstNodeKind kind, std::unique_ptr<AstNode> left, std::unique_ptr<AstNode> right, SourceLocation loc);
std::unique_ptr<AstNode> makeRange(bool inclusive, std::unique_ptr<AstNode> from, std::unique_ptr<AstNode> to, SourceLocation loc);
std::unique_ptr<AstNode> makeAssign(std::string op, std::unique_ptr<AstNode> target, std::unique_ptr<AstNode> value, SourceLocation loc);
std::unique_ptr<AstNode> makeIndex(std::unique_ptr<AstNode> target, std::unique_ptr<AstNode> index, SourceLocation loc);
std::unique_ptr<AstNode> makeProperty(std::unique_ptr<AstNode> target, std::string field, SourceLocation loc);
std::unique_ptr<AstNode> makeCall(std::string name, std::vector<std::unique_ptr<AstNode>> args, SourceLocation loc);
std::unique_ptr<AstNode> makeMethodCall(std::unique_ptr<AstNode> receiver, std::string name, std::vector<std::unique_ptr<AstNode>> args, SourceLocation loc);
std::unique_ptr<AstNode> makeClosure(std::shared_ptr<ScriptFunction> fn, SourceLocation loc);
std::unique_ptr<AstNode> makeBlock(std::vector<std::unique_ptr<AstNode>> stmts, SourceLocation loc);
std::unique_ptr<AstNode> makeIf(std::unique_ptr<AstNode> cond, std::unique_ptr<AstNode> thenBranch, std::unique_ptr<AstNode> elseBranch, SourceLocation loc);
std::unique_ptr<AstNode> makeWhile(std::unique_ptr<AstNode> cond, std::unique_ptr<AstNode> body, SourceLocation loc);
std::unique_ptr<AstNode> makeDoWhile(std::unique_ptr<AstNode> body, std::unique_ptr<AstNode> cond, bool isUntil, SourceLocation loc);
std::unique_ptr<AstNode> makeLoop(std::unique_ptr<AstNode> body, SourceLocation loc);
std::unique_ptr<AstNode> makeFor(std::vector<std::string> vars, std::unique_ptr<AstNode> iterable, std::unique_ptr<AstNode> body, SourceLocation loc);
std::unique_ptr<AstNode> makeLet(std::string name, bool isConst, std::unique_ptr<AstNode> init, SourceLocation loc);
std::unique_ptr<AstNode> makeFnDef(std::shared_ptr<ScriptFunction> fn, SourceLocation loc);
std::unique_ptr<AstNode> makeReturn(std::unique_ptr<AstNode> value, SourceLocation loc);
std::unique_ptr<AstNode> makeBreak(SourceLocation loc);
std::unique_ptr<AstNode> makeContinue(SourceLocation loc);

/// Deep copy of a subtree. Function bodies are shared, not cloned.
std::unique_ptr<AstNode> cloneNode(const AstNode& node);

/// Value of a literal node (isLiteral() must hold).
Value literalValue(const AstNode& node);

/// Literal node for a primitive value; nullptr for values with no literal form.
std::unique_ptr<AstNode> makeLiteral(const Value& value, SourceLocation loc);

} // namespace kestrel
