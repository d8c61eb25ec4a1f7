#include "kestrel/arithmetic.h"
#include "kestrel/error.h"
#include <cmath>
#include <cstdint>

namespace kestrel {

namespace {

RuntimeError overflow(const std::string& op) {
    return RuntimeError(RuntimeErrorKind::Overflow,
                        "Integer overflow in '" + op + "'", SourceLocation{});
}

RuntimeError divisionByZero(const std::string& op) {
    return RuntimeError(RuntimeErrorKind::DivisionByZero,
                        op == "%" ? "Modulo by zero" : "Division by zero", SourceLocation{});
}

// Checked i64 arithmetic: each returns true on overflow and leaves `r` unset.

bool addOverflows(int64_t a, int64_t b, int64_t& r) {
    if ((b > 0 && a > INT64_MAX - b) || (b < 0 && a < INT64_MIN - b)) return true;
    r = a + b;
    return false;
}

bool subOverflows(int64_t a, int64_t b, int64_t& r) {
    if ((b < 0 && a > INT64_MAX + b) || (b > 0 && a < INT64_MIN + b)) return true;
    r = a - b;
    return false;
}

bool mulOverflows(int64_t a, int64_t b, int64_t& r) {
    if (a > 0) {
        if (b > 0 ? a > INT64_MAX / b : b < INT64_MIN / a) return true;
    } else if (a < 0) {
        if (b > 0 ? a < INT64_MIN / b : (b != 0 && a < INT64_MAX / b)) return true;
    }
    r = a * b;
    return false;
}

std::optional<Value> intOp(const std::string& op, int64_t a, int64_t b) {
    int64_t r = 0;
    if (op == "+") {
        if (addOverflows(a, b, r)) throw overflow(op);
        return Value::integer(r);
    }
    if (op == "-") {
        if (subOverflows(a, b, r)) throw overflow(op);
        return Value::integer(r);
    }
    if (op == "*") {
        if (mulOverflows(a, b, r)) throw overflow(op);
        return Value::integer(r);
    }
    if (op == "/" || op == "%") {
        if (b == 0) throw divisionByZero(op);
        if (a == INT64_MIN && b == -1) throw overflow(op);
        return Value::integer(op == "/" ? a / b : a % b);
    }
    if (op == "**") {
        if (b < 0) {
            throw RuntimeError(RuntimeErrorKind::Arithmetic,
                               "Negative exponent " + std::to_string(b) +
                               " for integer power", SourceLocation{});
        }
        int64_t result = 1;
        int64_t base = a;
        while (b > 0) {
            if (b & 1) {
                if (mulOverflows(result, base, result)) throw overflow(op);
            }
            b >>= 1;
            if (b > 0 && mulOverflows(base, base, base)) throw overflow(op);
        }
        return Value::integer(result);
    }
    if (op == "<<" || op == ">>") {
        if (b < 0 || b >= 64) {
            throw RuntimeError(RuntimeErrorKind::Arithmetic,
                               "Bad shift amount " + std::to_string(b), SourceLocation{});
        }
        if (op == "<<") {
            return Value::integer(static_cast<int64_t>(static_cast<uint64_t>(a) << b));
        }
        return Value::integer(a >> b);
    }
    if (op == "&") return Value::integer(a & b);
    if (op == "|") return Value::integer(a | b);
    if (op == "^") return Value::integer(a ^ b);
    if (op == "==") return Value::boolean(a == b);
    if (op == "!=") return Value::boolean(a != b);
    if (op == "<") return Value::boolean(a < b);
    if (op == ">") return Value::boolean(a > b);
    if (op == "<=") return Value::boolean(a <= b);
    if (op == ">=") return Value::boolean(a >= b);
    return std::nullopt;
}

std::optional<Value> floatOp(const std::string& op, double a, double b) {
    if (op == "+") return Value::number(a + b);
    if (op == "-") return Value::number(a - b);
    if (op == "*") return Value::number(a * b);
    if (op == "/") {
        if (b == 0.0) throw divisionByZero(op);
        return Value::number(a / b);
    }
    if (op == "%") {
        if (b == 0.0) throw divisionByZero(op);
        return Value::number(std::fmod(a, b));
    }
    if (op == "**") return Value::number(std::pow(a, b));
    if (op == "==") return Value::boolean(a == b);
    if (op == "!=") return Value::boolean(a != b);
    if (op == "<") return Value::boolean(a < b);
    if (op == ">") return Value::boolean(a > b);
    if (op == "<=") return Value::boolean(a <= b);
    if (op == ">=") return Value::boolean(a >= b);
    return std::nullopt;
}

template <typename T>
std::optional<Value> ordering(const std::string& op, const T& a, const T& b) {
    if (op == "<") return Value::boolean(a < b);
    if (op == ">") return Value::boolean(a > b);
    if (op == "<=") return Value::boolean(a <= b);
    if (op == ">=") return Value::boolean(a >= b);
    return std::nullopt;
}

// Primitive operands that may be appended to a string with '+'.
bool isConcatenable(const Value& v) {
    switch (v.type()) {
        case Value::Type::Unit:
        case Value::Type::Bool:
        case Value::Type::Int:
        case Value::Type::Float:
        case Value::Type::Char:
        case Value::Type::String:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

std::optional<Value> applyBinary(const std::string& op, const Value& left, const Value& right) {
    // Host objects always go through registered operator functions
    if (left.isCustom() || right.isCustom()) return std::nullopt;

    if (left.isInt() && right.isInt()) {
        return intOp(op, left.asInt(), right.asInt());
    }
    if (left.isNumeric() && right.isNumeric()) {
        return floatOp(op, left.asNumber(), right.asNumber());
    }

    if (left.isBool() && right.isBool()) {
        bool a = left.asBool();
        bool b = right.asBool();
        if (op == "&") return Value::boolean(a && b);
        if (op == "|") return Value::boolean(a || b);
        if (op == "^") return Value::boolean(a != b);
    }

    // String concatenation with +
    if (op == "+" && (left.isString() || right.isString() ||
                      (left.isChar() && right.isChar()))) {
        if (isConcatenable(left) && isConcatenable(right)) {
            return Value::string(left.toString() + right.toString());
        }
    }

    // Array concatenation with +
    if (op == "+" && left.isArray() && right.isArray()) {
        auto& leftArr = left.asArray();
        auto& rightArr = right.asArray();
        Array result;
        result.reserve(leftArr.size() + rightArr.size());
        result.insert(result.end(), leftArr.begin(), leftArr.end());
        result.insert(result.end(), rightArr.begin(), rightArr.end());
        return Value::array(std::move(result));
    }

    // Map merge with +; the right side wins on duplicate keys
    if (op == "+" && left.isMap() && right.isMap()) {
        Map result = right.asMap();
        result.insert(left.asMap().begin(), left.asMap().end());
        return Value::map(std::move(result));
    }

    if (left.isString() && right.isString()) {
        if (auto r = ordering(op, left.asString(), right.asString())) return r;
    }
    if (left.isChar() && right.isChar()) {
        if (auto r = ordering(op, left.asChar(), right.asChar())) return r;
    }

    // Equality works on everything; different types are simply unequal
    if (op == "==") return Value::boolean(left == right);
    if (op == "!=") return Value::boolean(left != right);

    return std::nullopt;
}

std::optional<Value> applyUnary(const std::string& op, const Value& operand) {
    if (op == "-") {
        if (operand.isInt()) {
            if (operand.asInt() == INT64_MIN) throw overflow(op);
            return Value::integer(-operand.asInt());
        }
        if (operand.isFloat()) return Value::number(-operand.asFloat());
    } else if (op == "+") {
        if (operand.isNumeric()) return operand;
    } else if (op == "!") {
        if (operand.isBool()) return Value::boolean(!operand.asBool());
    }
    return std::nullopt;
}

uint64_t rangeLength(int64_t start, int64_t end, bool inclusive) {
    if (start > end || (start == end && !inclusive)) return 0;
    uint64_t span = static_cast<uint64_t>(end) - static_cast<uint64_t>(start);
    if (!inclusive) return span;
    return span == UINT64_MAX ? span : span + 1;
}

Value rangeToArray(const Value& from, const Value& to, bool inclusive) {
    if (!from.isInt() || !to.isInt()) {
        throw RuntimeError(RuntimeErrorKind::TypeMismatch,
                           std::string("Range bounds must be integers, got ") +
                           from.typeName() + " and " + to.typeName(), SourceLocation{});
    }
    int64_t start = from.asInt();
    int64_t end = to.asInt();
    Array range;
    range.reserve(static_cast<size_t>(rangeLength(start, end, inclusive)));
    if (start < end || (inclusive && start == end)) {
        for (int64_t i = start; i < end; i++) {
            range.push_back(Value::integer(i));
        }
        if (inclusive) range.push_back(Value::integer(end));
    }
    return Value::array(std::move(range));
}

bool isBinaryOperator(const std::string& op) {
    static const char* const kOps[] = {"+", "-", "*", "/", "%", "**", "<<", ">>", "&", "|",
                                       "^", "==", "!=", "<", "<=", ">", ">="};
    for (auto* known : kOps) {
        if (op == known) return true;
    }
    return false;
}

std::string compoundBaseOperator(const std::string& assignOp) {
    if (assignOp.size() < 2 || assignOp.back() != '=') return "";
    return assignOp.substr(0, assignOp.size() - 1);
}

} // namespace kestrel
