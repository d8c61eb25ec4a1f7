#include "kestrel/error.h"

namespace kestrel {

const char* lexErrorKindName(LexErrorKind kind) {
    switch (kind) {
        case LexErrorKind::UnterminatedString: return "UnterminatedString";
        case LexErrorKind::UnterminatedChar: return "UnterminatedChar";
        case LexErrorKind::InvalidEscape: return "InvalidEscape";
        case LexErrorKind::MalformedNumber: return "MalformedNumber";
        case LexErrorKind::MalformedChar: return "MalformedChar";
        case LexErrorKind::UnterminatedComment: return "UnterminatedComment";
        case LexErrorKind::UnexpectedCharacter: return "UnexpectedCharacter";
        case LexErrorKind::InvalidUtf8: return "InvalidUtf8";
    }
    return "Unknown";
}

const char* parseErrorKindName(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::UnexpectedToken: return "UnexpectedToken";
        case ParseErrorKind::MissingToken: return "MissingToken";
        case ParseErrorKind::DuplicateParameter: return "DuplicateParameter";
        case ParseErrorKind::InvalidAssignmentTarget: return "InvalidAssignmentTarget";
        case ParseErrorKind::LoopControlOutsideLoop: return "LoopControlOutsideLoop";
        case ParseErrorKind::FeatureDisabled: return "FeatureDisabled";
        case ParseErrorKind::DuplicateFunction: return "DuplicateFunction";
        case ParseErrorKind::WrongFnDefinition: return "WrongFnDefinition";
        case ParseErrorKind::DuplicateSwitchCase: return "DuplicateSwitchCase";
        case ParseErrorKind::InvalidSwitchCase: return "InvalidSwitchCase";
        case ParseErrorKind::AssignmentToConstant: return "AssignmentToConstant";
        case ParseErrorKind::ExprTooDeep: return "ExprTooDeep";
        case ParseErrorKind::DuplicateProperty: return "DuplicateProperty";
    }
    return "Unknown";
}

const char* runtimeErrorKindName(RuntimeErrorKind kind) {
    switch (kind) {
        case RuntimeErrorKind::TypeMismatch: return "TypeMismatch";
        case RuntimeErrorKind::UndefinedVariable: return "UndefinedVariable";
        case RuntimeErrorKind::FunctionNotFound: return "FunctionNotFound";
        case RuntimeErrorKind::AmbiguousFunction: return "AmbiguousFunction";
        case RuntimeErrorKind::DivisionByZero: return "DivisionByZero";
        case RuntimeErrorKind::Overflow: return "Overflow";
        case RuntimeErrorKind::Arithmetic: return "Arithmetic";
        case RuntimeErrorKind::IndexOutOfBounds: return "IndexOutOfBounds";
        case RuntimeErrorKind::PropertyNotFound: return "PropertyNotFound";
        case RuntimeErrorKind::AssignmentToConstant: return "AssignmentToConstant";
        case RuntimeErrorKind::DanglingLoopControl: return "DanglingLoopControl";
        case RuntimeErrorKind::ResourceLimitExceeded: return "ResourceLimitExceeded";
        case RuntimeErrorKind::ExecutionInterrupted: return "ExecutionInterrupted";
        case RuntimeErrorKind::NativeError: return "NativeError";
    }
    return "Unknown";
}

} // namespace kestrel
