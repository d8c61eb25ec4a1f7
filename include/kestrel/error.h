#pragma once

#include "source_location.h"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace kestrel {

enum class LexErrorKind {
    UnterminatedString,
    UnterminatedChar,
    InvalidEscape,
    MalformedNumber,
    MalformedChar,
    UnterminatedComment,
    UnexpectedCharacter,
    InvalidUtf8,
};

enum class ParseErrorKind {
    UnexpectedToken,
    MissingToken,
    DuplicateParameter,
    InvalidAssignmentTarget,
    LoopControlOutsideLoop,
    FeatureDisabled,
    DuplicateFunction,
    WrongFnDefinition,
    DuplicateSwitchCase,
    InvalidSwitchCase,
    AssignmentToConstant,
    ExprTooDeep,
    DuplicateProperty,
};

enum class RuntimeErrorKind {
    TypeMismatch,
    UndefinedVariable,
    FunctionNotFound,
    AmbiguousFunction,
    DivisionByZero,
    Overflow,
    Arithmetic,
    IndexOutOfBounds,
    PropertyNotFound,
    AssignmentToConstant,
    DanglingLoopControl,
    ResourceLimitExceeded,
    ExecutionInterrupted,
    NativeError,
};

const char* lexErrorKindName(LexErrorKind kind);
const char* parseErrorKindName(ParseErrorKind kind);
const char* runtimeErrorKindName(RuntimeErrorKind kind);

/// Base of every error raised while turning source text into an Ast.
/// Compilation never yields partial output: either an Ast or one of these.
class CompileError : public std::runtime_error {
public:
    enum class Stage { Lex, Parse };

    CompileError(Stage stage, const std::string& message, SourceLocation loc)
        : std::runtime_error(loc.toString() + ": " + message),
          stage_(stage), location_(loc), message_(message) {}

    Stage stage() const { return stage_; }
    const SourceLocation& location() const { return location_; }
    /// Message without the location prefix.
    const std::string& message() const { return message_; }

private:
    Stage stage_;
    SourceLocation location_;
    std::string message_;
};

class LexError : public CompileError {
public:
    LexError(LexErrorKind kind, const std::string& message, SourceLocation loc)
        : CompileError(Stage::Lex, message, loc), kind_(kind) {}

    LexErrorKind kind() const { return kind_; }

private:
    LexErrorKind kind_;
};

class ParseError : public CompileError {
public:
    ParseError(ParseErrorKind kind, const std::string& message, SourceLocation loc)
        : CompileError(Stage::Parse, message, loc), kind_(kind) {}

    ParseErrorKind kind() const { return kind_; }

private:
    ParseErrorKind kind_;
};

/// Recoverable evaluation error. Propagates to the evaluate() boundary.
class RuntimeError : public std::runtime_error {
public:
    RuntimeError(RuntimeErrorKind kind, const std::string& message, SourceLocation loc)
        : std::runtime_error(loc.isNone() ? message : loc.toString() + ": " + message),
          kind_(kind), location_(loc), message_(message) {}

    RuntimeError(RuntimeErrorKind kind, const std::string& message, SourceLocation loc,
                 std::string name, size_t arity = 0)
        : RuntimeError(kind, message, loc) {
        name_ = std::move(name);
        arity_ = arity;
    }

    RuntimeErrorKind kind() const { return kind_; }
    const SourceLocation& location() const { return location_; }
    /// Message without the location prefix.
    const std::string& message() const { return message_; }

    /// Copy of this error positioned at `loc`, unless it already has a position.
    RuntimeError withLocation(SourceLocation loc) const {
        if (!location_.isNone()) return *this;
        return RuntimeError(kind_, message_, loc, name_, arity_);
    }

    /// Variable or function name involved, when there is one.
    const std::string& name() const { return name_; }
    /// Call arity for FunctionNotFound / AmbiguousFunction.
    size_t arity() const { return arity_; }

private:
    RuntimeErrorKind kind_;
    SourceLocation location_;
    std::string message_;
    std::string name_;
    size_t arity_ = 0;
};

/// Implementation fault (malformed AST, broken invariant). Never caused by user input.
class InternalError : public std::logic_error {
public:
    explicit InternalError(const std::string& message)
        : std::logic_error("internal error: " + message) {}
};

} // namespace kestrel
