#include "kestrel/ast_printer.h"
#include "kestrel/error.h"
#include "kestrel/value.h"
#include <cmath>

namespace kestrel {

namespace {

std::string join(const std::vector<std::unique_ptr<AstNode>>& nodes, size_t from,
                 const char* sep) {
    std::string out;
    for (size_t i = from; i < nodes.size(); i++) {
        if (i > from) out += sep;
        out += formatNode(*nodes[i]);
    }
    return out;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

std::string charText(uint32_t cp) {
    std::string s;
    appendUtf8(s, static_cast<char32_t>(cp));
    return quoteString(s, '\'');
}

// Switch patterns are written bare, negative numbers included.
std::string patternText(const AstNode& lit) {
    switch (lit.kind) {
        case AstNodeKind::IntLit:   return std::to_string(lit.intValue);
        case AstNodeKind::FloatLit: return formatFloat(lit.floatValue);
        default:                    return formatNode(lit);
    }
}

// Expressions that would swallow a following postfix or operator when
// written bare.
bool needsParens(const AstNode& node) {
    switch (node.kind) {
        case AstNodeKind::Block:
        case AstNodeKind::If:
        case AstNodeKind::Switch:
        case AstNodeKind::While:
        case AstNodeKind::DoWhile:
        case AstNodeKind::Loop:
        case AstNodeKind::For:
            return true;
        default:
            return false;
    }
}

std::string operand(const AstNode& node) {
    std::string text = formatNode(node);
    return needsParens(node) ? "(" + text + ")" : text;
}

// Bodies must be blocks in the grammar; the optimizer may leave another node.
std::string blockText(const AstNode& node) {
    if (node.kind == AstNodeKind::Block) return formatNode(node);
    return "{ " + formatNode(node) + " }";
}

} // anonymous namespace

std::string formatNode(const AstNode& node) {
    switch (node.kind) {
        case AstNodeKind::IntLit:
            if (node.intValue < 0) {
                if (node.intValue == INT64_MIN) return "(-9223372036854775807 - 1)";
                return "(-" + std::to_string(-node.intValue) + ")";
            }
            return std::to_string(node.intValue);
        case AstNodeKind::FloatLit:
            if (std::signbit(node.floatValue)) return "(-" + formatFloat(-node.floatValue) + ")";
            return formatFloat(node.floatValue);
        case AstNodeKind::StringLit:
            return quoteString(node.stringValue);
        case AstNodeKind::CharLit:
            return charText(node.charValue);
        case AstNodeKind::BoolLit:
            return node.boolValue ? "true" : "false";
        case AstNodeKind::UnitLit:
            return "()";

        case AstNodeKind::ArrayLit:
            return "[" + join(node.children, 0, ", ") + "]";
        case AstNodeKind::MapLit: {
            std::string out = "#{";
            for (size_t i = 0; i < node.children.size(); i++) {
                if (i > 0) out += ", ";
                out += quoteString(node.nameParts[i]) + ": " + formatNode(*node.children[i]);
            }
            return out + "}";
        }
        case AstNodeKind::Name:
            return node.stringValue;

        case AstNodeKind::Unary:
            return "(" + node.op + operand(*node.children[0]) + ")";
        case AstNodeKind::Binary:
            return "(" + operand(*node.children[0]) + " " + node.op + " " +
                   operand(*node.children[1]) + ")";
        case AstNodeKind::And:
            return "(" + operand(*node.children[0]) + " && " + operand(*node.children[1]) + ")";
        case AstNodeKind::Or:
            return "(" + operand(*node.children[0]) + " || " + operand(*node.children[1]) + ")";
        case AstNodeKind::Coalesce:
            return "(" + operand(*node.children[0]) + " ?? " + operand(*node.children[1]) + ")";
        case AstNodeKind::Range:
            return "(" + operand(*node.children[0]) + (node.boolValue ? " ..= " : " .. ") +
                   operand(*node.children[1]) + ")";
        case AstNodeKind::Assign:
            return "(" + formatNode(*node.children[0]) + " " + node.op + " " +
                   formatNode(*node.children[1]) + ")";

        case AstNodeKind::Index:
            return operand(*node.children[0]) + "[" + formatNode(*node.children[1]) + "]";
        case AstNodeKind::Property:
            return operand(*node.children[0]) + "." + node.stringValue;
        case AstNodeKind::Call:
            return node.stringValue + "(" + join(node.children, 0, ", ") + ")";
        case AstNodeKind::MethodCall:
            return operand(*node.children[0]) + "." + node.stringValue + "(" +
                   join(node.children, 1, ", ") + ")";
        case AstNodeKind::Closure: {
            // Closure bodies extend as far as possible; always parenthesize
            auto& fn = *node.function;
            std::string params = fn.params.empty() ? "||" : "|" + joinNames(fn.params) + "|";
            return "(" + params + " " + formatNode(*fn.body) + ")";
        }

        case AstNodeKind::Block:
            if (node.children.empty()) return "{ }";
            return "{ " + join(node.children, 0, "; ") + " }";
        case AstNodeKind::If: {
            std::string out = "if " + formatNode(*node.children[0]) + " " +
                              blockText(*node.children[1]);
            if (node.hasElse) {
                const AstNode& alt = *node.children[2];
                out += " else ";
                out += alt.kind == AstNodeKind::If ? formatNode(alt) : blockText(alt);
            }
            return out;
        }
        case AstNodeKind::Switch: {
            std::string out = "switch " + formatNode(*node.children[0]) + " { ";
            size_t armsEnd = node.children.size() - (node.hasElse ? 1 : 0);
            bool first = true;
            for (size_t i = 1; i + 1 < armsEnd; i += 2) {
                if (!first) out += ", ";
                first = false;
                auto& patterns = node.children[i]->children;
                for (size_t p = 0; p < patterns.size(); p++) {
                    if (p > 0) out += " | ";
                    out += patternText(*patterns[p]);
                }
                out += " => " + formatNode(*node.children[i + 1]);
            }
            if (node.hasElse) {
                if (!first) out += ", ";
                out += "_ => " + formatNode(*node.children.back());
            }
            return out + " }";
        }
        case AstNodeKind::While:
            return "while " + formatNode(*node.children[0]) + " " + blockText(*node.children[1]);
        case AstNodeKind::DoWhile:
            return "do " + blockText(*node.children[0]) + (node.boolValue ? " until " : " while ") +
                   formatNode(*node.children[1]);
        case AstNodeKind::Loop:
            return "loop " + blockText(*node.children[0]);
        case AstNodeKind::For: {
            std::string vars = node.nameParts.size() > 1
                ? "(" + joinNames(node.nameParts) + ")"
                : node.nameParts[0];
            return "for " + vars + " in " + formatNode(*node.children[0]) + " " +
                   blockText(*node.children[1]);
        }

        case AstNodeKind::Let: {
            std::string out = (node.boolValue ? "const " : "let ") + node.nameParts[0];
            if (!node.children.empty()) out += " = " + formatNode(*node.children[0]);
            return out;
        }
        case AstNodeKind::FnDef: {
            auto& fn = *node.function;
            return "fn " + fn.name + "(" + joinNames(fn.params) + ") " + blockText(*fn.body);
        }
        case AstNodeKind::Return:
            if (node.children.empty()) return "return";
            return "return " + formatNode(*node.children[0]);
        case AstNodeKind::Break:
            return "break";
        case AstNodeKind::Continue:
            return "continue";
    }
    throw InternalError(std::string("cannot format node kind ") + astNodeKindName(node.kind));
}

std::string formatAst(const Ast& ast) {
    std::string out;
    for (auto& stmt : ast.statements()) {
        out += formatNode(*stmt);
        out += ";\n";
    }
    return out;
}

bool structurallyEqual(const AstNode& a, const AstNode& b) {
    if (a.kind != b.kind) return false;
    if (a.intValue != b.intValue || a.stringValue != b.stringValue ||
        a.charValue != b.charValue || a.boolValue != b.boolValue ||
        a.hasElse != b.hasElse || a.op != b.op || a.nameParts != b.nameParts) {
        return false;
    }
    if (a.floatValue != b.floatValue &&
        !(std::isnan(a.floatValue) && std::isnan(b.floatValue))) {
        return false;
    }
    if (a.children.size() != b.children.size()) return false;
    for (size_t i = 0; i < a.children.size(); i++) {
        if (!structurallyEqual(*a.children[i], *b.children[i])) return false;
    }

    if (!a.function || !b.function) return a.function == b.function;
    auto& fa = *a.function;
    auto& fb = *b.function;
    return fa.name == fb.name && fa.params == fb.params && fa.captures == fb.captures &&
           structurallyEqual(*fa.body, *fb.body);
}

bool structurallyEqual(const Ast& a, const Ast& b) {
    auto& sa = a.statements();
    auto& sb = b.statements();
    if (sa.size() != sb.size()) return false;
    for (size_t i = 0; i < sa.size(); i++) {
        if (!structurallyEqual(*sa[i], *sb[i])) return false;
    }
    return true;
}

} // namespace kestrel
