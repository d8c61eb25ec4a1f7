#pragma once

#include "value.h"
#include <cstdint>
#include <optional>
#include <string>

namespace kestrel {

// Built-in operator semantics, shared by the evaluator and the optimizer's
// constant folder so a folded expression always matches its runtime value.
//
// Each function returns std::nullopt when the operand types have no built-in
// meaning (the caller then tries a registered operator function) and throws
// RuntimeError (without a location) for DivisionByZero, Overflow and
// Arithmetic failures.

std::optional<Value> applyBinary(const std::string& op, const Value& left, const Value& right);
std::optional<Value> applyUnary(const std::string& op, const Value& operand);

/// Number of integers in `start..end` (or `start..=end`), saturating at
/// UINT64_MAX for the full inclusive range.
uint64_t rangeLength(int64_t start, int64_t end, bool inclusive);

/// Materialize `from..to` (or `from..=to`) as an array of integers.
Value rangeToArray(const Value& from, const Value& to, bool inclusive);

/// True for operators applyBinary() knows about.
bool isBinaryOperator(const std::string& op);

/// "+=" -> "+"; returns an empty string for plain "=".
std::string compoundBaseOperator(const std::string& assignOp);

} // namespace kestrel
