#pragma once

#include "ast.h"
#include <string>

namespace kestrel {

/// Canonical source text for a program: one statement per line, every
/// compound expression parenthesized. Parsing the output yields a
/// structurally equal tree.
std::string formatAst(const Ast& ast);
std::string formatNode(const AstNode& node);

/// Tree equality ignoring source locations.
bool structurallyEqual(const AstNode& a, const AstNode& b);
bool structurallyEqual(const Ast& a, const Ast& b);

} // namespace kestrel
