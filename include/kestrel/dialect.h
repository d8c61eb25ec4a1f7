#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace kestrel {

enum class OptimizationLevel {
    None,
    Simple,   // folding, propagation, dead branches, no-op pruning
    Full,     // Simple + folding of pure native calls with literal arguments
};

/// Grammar and runtime limits accepted by one engine instance.
/// A zero limit means "unlimited" unless documented otherwise.
struct DialectConfig {
    bool allow_closures = true;
    bool allow_decimal_literals = true;
    bool allow_switch = true;
    // Reject break/continue outside a loop while parsing instead of at runtime.
    bool strict_loop_control = false;
    OptimizationLevel optimization_level = OptimizationLevel::Simple;

    size_t max_call_depth = 64;
    uint64_t max_operations = 0;
    size_t max_expr_depth = 64;
    size_t max_string_size = 0;
    size_t max_array_size = 0;
    size_t max_map_size = 0;
};

/// Per-evaluation hooks supplied by the host.
struct EvalOptions {
    // Evaluation stops with ExecutionInterrupted once this reads true.
    const std::atomic<bool>* interruptFlag = nullptr;
    // Called with the running operation count; returning false interrupts.
    std::function<bool(uint64_t)> onProgress;
};

} // namespace kestrel
