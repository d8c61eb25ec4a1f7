#pragma once

#include "ast.h"
#include "dialect.h"
#include <cstddef>

namespace kestrel {

class Scope;
class FunctionRegistry;

struct OptimizerStats {
    size_t folded = 0;           // unary/binary/logical expressions replaced by literals
    size_t propagated = 0;       // constant names replaced by their values
    size_t branchesRemoved = 0;  // if/switch/while decided at compile time
    size_t pruned = 0;           // statements with no effect removed from blocks
    size_t callsFolded = 0;      // pure native calls evaluated at compile time
};

/// Rewrite `ast` in place. The result always evaluates to the same value,
/// with the same errors, as the input.
///
/// `constants` supplies host constant bindings to propagate (may be null);
/// `registry` is consulted at OptimizationLevel::Full for pure natives.
OptimizerStats optimize(Ast& ast, OptimizationLevel level, const Scope* constants = nullptr,
                        const FunctionRegistry* registry = nullptr);

} // namespace kestrel
