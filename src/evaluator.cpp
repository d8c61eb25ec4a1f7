#include "kestrel/evaluator.h"
#include "kestrel/arithmetic.h"
#include "kestrel/ast.h"
#include "kestrel/error.h"
#include "kestrel/native_function.h"

namespace kestrel {

namespace {

// Largest range materialized as an array when max_array_size is unlimited.
constexpr uint64_t kMaxRangeElements = uint64_t{1} << 24;

// -- UTF-8 helpers for string indexing and iteration --

char32_t decodeUtf8(const std::string& s, size_t offset, size_t& length) {
    auto b = static_cast<unsigned char>(s[offset]);
    size_t extra = b >= 0xF0 ? 3 : b >= 0xE0 ? 2 : b >= 0xC0 ? 1 : 0;
    if (offset + extra >= s.size()) extra = s.size() - offset - 1;  // truncated sequence
    char32_t cp = extra == 0 ? b : extra == 1 ? (b & 0x1F) : extra == 2 ? (b & 0x0F) : (b & 0x07);
    for (size_t i = 1; i <= extra; i++) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[offset + i]) & 0x3F);
    }
    length = extra + 1;
    return cp;
}

std::vector<size_t> codePointOffsets(const std::string& s) {
    std::vector<size_t> offsets;
    size_t pos = 0;
    while (pos < s.size()) {
        offsets.push_back(pos);
        size_t len = 0;
        decodeUtf8(s, pos, len);
        pos += len;
    }
    return offsets;
}

size_t normalizeIndex(int64_t index, size_t size, const char* what, SourceLocation loc) {
    int64_t i = index < 0 ? index + static_cast<int64_t>(size) : index;
    if (i < 0 || i >= static_cast<int64_t>(size)) {
        throw RuntimeError(RuntimeErrorKind::IndexOutOfBounds,
                           "Index " + std::to_string(index) + " out of bounds for " + what +
                           " of length " + std::to_string(size), loc);
    }
    return static_cast<size_t>(i);
}

RuntimeError typeMismatch(const std::string& message, SourceLocation loc) {
    return RuntimeError(RuntimeErrorKind::TypeMismatch, message, loc);
}

// Tracks one level of script-function nesting.
class CallDepthGuard {
public:
    explicit CallDepthGuard(size_t& depth) : depth_(depth) { depth_++; }
    ~CallDepthGuard() { depth_--; }
private:
    size_t& depth_;
};

// Holds a variable's value outside the Scope while it is updated in place,
// and puts it back on every exit path. Nothing that runs during the update
// can invalidate a reference into the Scope's storage this way.
class VariableLease {
public:
    VariableLease(Scope& scope, const std::string& name, Value& slot)
        : scope_(scope), name_(name), value_(std::move(slot)) {
        slot = Value();
    }
    ~VariableLease() {
        if (Value* slot = scope_.lookup(name_)) *slot = std::move(value_);
    }

    Value& value() { return value_; }

private:
    Scope& scope_;
    const std::string& name_;
    Value value_;
};

// Moves a leased receiver into the argument list for the duration of a
// native call and returns it to the lease afterwards.
class ReceiverLoan {
public:
    ReceiverLoan(Value& owner, Value& arg) : owner_(owner), arg_(arg) {
        arg_ = std::move(owner_);
    }
    ~ReceiverLoan() { owner_ = std::move(arg_); }

private:
    Value& owner_;
    Value& arg_;
};

} // anonymous namespace

Evaluator::Evaluator(Scope& scope, const FunctionRegistry& registry, const DialectConfig& dialect,
                     const FunctionRegistry* library, EvalOptions options)
    : scope_(scope), registry_(registry), library_(library), dialect_(dialect),
      options_(std::move(options)) {}

Value Evaluator::run(const std::vector<std::unique_ptr<AstNode>>& statements) {
    Value last;
    for (auto& stmt : statements) {
        tick(stmt->loc);
        Flow f = eval(*stmt);
        switch (f.kind) {
            case FlowKind::Normal:
                last = std::move(f.value);
                break;
            case FlowKind::Return:
                return std::move(f.value);
            case FlowKind::Break:
                throw RuntimeError(RuntimeErrorKind::DanglingLoopControl,
                                   "'break' outside of a loop", f.loc);
            case FlowKind::Continue:
                throw RuntimeError(RuntimeErrorKind::DanglingLoopControl,
                                   "'continue' outside of a loop", f.loc);
        }
    }
    return last;
}

Flow Evaluator::eval(const AstNode& node) {
    switch (node.kind) {
        case AstNodeKind::IntLit:     return Flow::normal(Value::integer(node.intValue));
        case AstNodeKind::FloatLit:   return Flow::normal(Value::number(node.floatValue));
        case AstNodeKind::StringLit: {
            auto v = Value::string(node.stringValue);
            checkSize(v, node.loc);
            return Flow::normal(std::move(v));
        }
        case AstNodeKind::CharLit:
            return Flow::normal(Value::character(static_cast<char32_t>(node.charValue)));
        case AstNodeKind::BoolLit:    return Flow::normal(Value::boolean(node.boolValue));
        case AstNodeKind::UnitLit:    return Flow::normal(Value::unit());
        case AstNodeKind::ArrayLit:   return evalArrayLit(node);
        case AstNodeKind::MapLit:     return evalMapLit(node);
        case AstNodeKind::Name:       return evalName(node);
        case AstNodeKind::Unary:      return evalUnary(node);
        case AstNodeKind::Binary:     return evalBinary(node);
        case AstNodeKind::And:
        case AstNodeKind::Or:         return evalLogical(node);
        case AstNodeKind::Coalesce:   return evalCoalesce(node);
        case AstNodeKind::Range:      return evalRange(node);
        case AstNodeKind::Assign:     return evalAssign(node);
        case AstNodeKind::Index:      return evalIndex(node);
        case AstNodeKind::Property:   return evalProperty(node);
        case AstNodeKind::Call:       return evalCall(node);
        case AstNodeKind::MethodCall: return evalMethodCall(node);
        case AstNodeKind::Closure:    return evalClosure(node);
        case AstNodeKind::Block:      return evalBlock(node);
        case AstNodeKind::If:         return evalIf(node);
        case AstNodeKind::Switch:     return evalSwitch(node);
        case AstNodeKind::While:      return evalWhile(node);
        case AstNodeKind::DoWhile:    return evalDoWhile(node);
        case AstNodeKind::Loop:       return evalLoop(node);
        case AstNodeKind::For:        return evalFor(node);
        case AstNodeKind::Let:        return evalLet(node);
        case AstNodeKind::FnDef:      return Flow::normal(Value::unit());  // hoisted at compile time
        case AstNodeKind::Return:     return evalReturn(node);
        case AstNodeKind::Break:      return {FlowKind::Break, Value(), node.loc};
        case AstNodeKind::Continue:   return {FlowKind::Continue, Value(), node.loc};
    }
    throw InternalError("Unknown AST node kind");
}

bool Evaluator::evalArgs(const AstNode& node, size_t from, std::vector<Value>& out,
                         Flow& signal) {
    for (size_t i = from; i < node.children.size(); i++) {
        Flow f = eval(*node.children[i]);
        if (!f.isNormal()) {
            signal = std::move(f);
            return false;
        }
        out.push_back(std::move(f.value));
    }
    return true;
}

// -- Literals and names --

Flow Evaluator::evalArrayLit(const AstNode& node) {
    Array elems;
    elems.reserve(node.children.size());
    Flow signal;
    if (!evalArgs(node, 0, elems, signal)) return signal;
    auto v = Value::array(std::move(elems));
    checkSize(v, node.loc);
    return Flow::normal(std::move(v));
}

Flow Evaluator::evalMapLit(const AstNode& node) {
    Map entries;
    for (size_t i = 0; i < node.children.size(); i++) {
        Flow f = eval(*node.children[i]);
        if (!f.isNormal()) return f;
        entries[node.nameParts[i]] = std::move(f.value);
    }
    auto v = Value::map(std::move(entries));
    checkSize(v, node.loc);
    return Flow::normal(std::move(v));
}

Flow Evaluator::evalName(const AstNode& node) {
    if (const Value* v = scope_.lookup(node.stringValue)) {
        return Flow::normal(*v);
    }
    throw RuntimeError(RuntimeErrorKind::UndefinedVariable,
                       "Undefined variable: " + node.stringValue, node.loc, node.stringValue);
}

// -- Operators --

Flow Evaluator::evalUnary(const AstNode& node) {
    Flow operand = eval(*node.children[0]);
    if (!operand.isNormal()) return operand;

    std::optional<Value> result;
    try {
        result = applyUnary(node.op, operand.value);
    } catch (const RuntimeError& e) {
        throw e.withLocation(node.loc);
    }
    if (result) return Flow::normal(std::move(*result));

    std::vector<Value> args{operand.value};
    if (auto* entry = findFunction(node.op, args, node.loc)) {
        return Flow::normal(invoke(*entry, node.op, args, node.loc));
    }
    throw typeMismatch("Cannot apply unary '" + node.op + "' to " + operand.value.typeName(),
                       node.loc);
}

Flow Evaluator::evalBinary(const AstNode& node) {
    Flow left = eval(*node.children[0]);
    if (!left.isNormal()) return left;
    Flow right = eval(*node.children[1]);
    if (!right.isNormal()) return right;
    return Flow::normal(applyOperator(node.op, left.value, right.value, node.loc));
}

Value Evaluator::applyOperator(const std::string& op, const Value& left, const Value& right,
                               SourceLocation loc) {
    std::optional<Value> result;
    try {
        result = applyBinary(op, left, right);
    } catch (const RuntimeError& e) {
        throw e.withLocation(loc);
    }
    if (result) {
        checkSize(*result, loc);
        return std::move(*result);
    }

    // Host-defined operator overloads
    std::vector<Value> args{left, right};
    if (auto* entry = findFunction(op, args, loc)) {
        return invoke(*entry, op, args, loc);
    }
    if (op == "==") return Value::boolean(left == right);
    if (op == "!=") return Value::boolean(left != right);

    throw typeMismatch("Cannot apply '" + op + "' to " + left.typeName() + " and " +
                       right.typeName(), loc);
}

Flow Evaluator::evalLogical(const AstNode& node) {
    bool isAnd = node.kind == AstNodeKind::And;
    const char* opName = isAnd ? "&&" : "||";

    Flow left = eval(*node.children[0]);
    if (!left.isNormal()) return left;
    if (!left.value.isBool()) {
        throw typeMismatch(std::string("Operands of '") + opName + "' must be bool, got " +
                           left.value.typeName(), node.loc);
    }
    // Short-circuit
    if (left.value.asBool() != isAnd) return left;

    Flow right = eval(*node.children[1]);
    if (!right.isNormal()) return right;
    if (!right.value.isBool()) {
        throw typeMismatch(std::string("Operands of '") + opName + "' must be bool, got " +
                           right.value.typeName(), node.loc);
    }
    return right;
}

Flow Evaluator::evalCoalesce(const AstNode& node) {
    Flow left = eval(*node.children[0]);
    if (!left.isNormal() || !left.value.isUnit()) return left;
    return eval(*node.children[1]);
}

Flow Evaluator::evalRange(const AstNode& node) {
    Flow from = eval(*node.children[0]);
    if (!from.isNormal()) return from;
    Flow to = eval(*node.children[1]);
    if (!to.isNormal()) return to;

    // A range used as a value becomes an array; `for` iterates ranges lazily instead
    if (from.value.isInt() && to.value.isInt()) {
        uint64_t count = rangeLength(from.value.asInt(), to.value.asInt(), node.boolValue);
        uint64_t limit = dialect_.max_array_size > 0 ? dialect_.max_array_size
                                                     : kMaxRangeElements;
        if (count > limit) {
            throw RuntimeError(RuntimeErrorKind::ResourceLimitExceeded,
                               "Range of " + std::to_string(count) +
                               " elements exceeds the array size limit of " +
                               std::to_string(limit), node.loc);
        }
    }
    try {
        return Flow::normal(rangeToArray(from.value, to.value, node.boolValue));
    } catch (const RuntimeError& e) {
        throw e.withLocation(node.loc);
    }
}

// -- Assignment --

Flow Evaluator::evalAssign(const AstNode& node) {
    const AstNode& target = *node.children[0];
    std::string baseOp = compoundBaseOperator(node.op);

    std::string root;
    std::vector<Accessor> path;
    Flow signal;
    if (!collectPath(target, root, path, signal)) return signal;

    Flow rhs = eval(*node.children[1]);
    if (!rhs.isNormal()) return rhs;

    if (!scope_.contains(root)) {
        throw RuntimeError(RuntimeErrorKind::UndefinedVariable,
                           "Undefined variable: " + root, target.loc, root);
    }
    if (scope_.isConstant(root)) {
        throw RuntimeError(RuntimeErrorKind::AssignmentToConstant,
                           "Cannot assign to constant '" + root + "'", node.loc, root);
    }
    return Flow::normal(updatePlace(root, path, baseOp, rhs.value, node.loc));
}

bool Evaluator::collectPath(const AstNode& target, std::string& root,
                            std::vector<Accessor>& path, Flow& signal) {
    switch (target.kind) {
        case AstNodeKind::Name:
            root = target.stringValue;
            return true;
        case AstNodeKind::Index: {
            if (!collectPath(*target.children[0], root, path, signal)) return false;
            Flow index = eval(*target.children[1]);
            if (!index.isNormal()) {
                signal = std::move(index);
                return false;
            }
            path.push_back({false, std::move(index.value), target.loc});
            return true;
        }
        case AstNodeKind::Property:
            if (!collectPath(*target.children[0], root, path, signal)) return false;
            path.push_back({true, Value::string(target.stringValue), target.loc});
            return true;
        default:
            throw InternalError(std::string("Not an assignment target: ") +
                                astNodeKindName(target.kind));
    }
}

Value Evaluator::readPlace(const std::string& root, const std::vector<Accessor>& path,
                           SourceLocation loc) {
    const Value* slot = scope_.lookup(root);
    if (!slot) {
        throw RuntimeError(RuntimeErrorKind::UndefinedVariable,
                           "Undefined variable: " + root, loc, root);
    }
    Value current = *slot;
    for (auto& acc : path) {
        current = acc.isProperty ? propertyValue(current, acc.key.asString(), acc.loc)
                                 : indexValue(current, acc.key, acc.loc);
    }
    return current;
}

Value Evaluator::updatePlace(const std::string& root, const std::vector<Accessor>& path,
                             const std::string& op, const Value& rhs, SourceLocation loc) {
    Value* slot = scope_.lookup(root);
    if (!slot) {
        throw RuntimeError(RuntimeErrorKind::UndefinedVariable,
                           "Undefined variable: " + root, loc, root);
    }
    VariableLease lease(scope_, root, *slot);
    return assignPath(lease.value(), path, 0, op, rhs, loc);
}

Value Evaluator::assignPath(Value& container, const std::vector<Accessor>& path, size_t i,
                            const std::string& op, const Value& rhs, SourceLocation loc) {
    if (i == path.size()) {
        Value updated = op.empty() ? rhs : applyOperator(op, container, rhs, loc);
        container = updated;
        return updated;
    }

    const Accessor& acc = path[i];
    bool last = i + 1 == path.size();

    switch (container.type()) {
        case Value::Type::Array: {
            if (acc.isProperty) break;
            if (!acc.key.isInt()) {
                throw typeMismatch("Array index must be i64, got " + acc.key.typeName(), acc.loc);
            }
            auto& arr = container.asArrayMut();
            size_t idx = normalizeIndex(acc.key.asInt(), arr.size(), "array", acc.loc);
            return assignPath(arr[idx], path, i + 1, op, rhs, loc);
        }
        case Value::Type::Map: {
            if (!acc.key.isString()) {
                throw typeMismatch("Map key must be a string, got " + acc.key.typeName(), acc.loc);
            }
            const std::string& key = acc.key.asString();
            auto& map = container.asMapMut();
            auto it = map.find(key);
            if (it == map.end()) {
                if (!last) {
                    throw RuntimeError(RuntimeErrorKind::PropertyNotFound,
                                       "Property '" + key + "' not found", acc.loc, key);
                }
                if (dialect_.max_map_size > 0 && map.size() >= dialect_.max_map_size) {
                    throw RuntimeError(RuntimeErrorKind::ResourceLimitExceeded,
                                       "Size of map (" + std::to_string(map.size() + 1) +
                                       ") exceeds the limit of " +
                                       std::to_string(dialect_.max_map_size), acc.loc);
                }
                it = map.emplace(key, Value()).first;
            }
            return assignPath(it->second, path, i + 1, op, rhs, loc);
        }
        case Value::Type::String: {
            if (acc.isProperty || !last || !acc.key.isInt()) break;
            auto& s = container.asStringMut();
            auto offsets = codePointOffsets(s);
            size_t idx = normalizeIndex(acc.key.asInt(), offsets.size(), "string", acc.loc);
            size_t len = 0;
            Value current = Value::character(decodeUtf8(s, offsets[idx], len));
            Value updated = op.empty() ? rhs : applyOperator(op, current, rhs, loc);
            if (!updated.isChar()) {
                throw typeMismatch("Only a char can be stored into a string, got " +
                                   updated.typeName(), loc);
            }
            std::string encoded;
            appendUtf8(encoded, updated.asChar());
            s.replace(offsets[idx], len, encoded);
            return updated;
        }
        case Value::Type::Custom: {
            // Read-modify-write through the host's accessor functions
            std::string getter = acc.isProperty ? "get$" + acc.key.asString() : "index$get";
            std::string setter = acc.isProperty ? "set$" + acc.key.asString() : "index$set";
            auto missingKind = acc.isProperty ? RuntimeErrorKind::PropertyNotFound
                                              : RuntimeErrorKind::TypeMismatch;
            std::string what = acc.isProperty
                ? "Property '" + acc.key.asString() + "' not found on " + container.typeName()
                : "Cannot index into " + container.typeName();

            std::vector<Value> getArgs{container};
            if (!acc.isProperty) getArgs.push_back(acc.key);
            Value inner = accessorCall(getter, getArgs, missingKind, what, acc.loc);

            Value result = assignPath(inner, path, i + 1, op, rhs, loc);

            std::vector<Value> setArgs{container};
            if (!acc.isProperty) setArgs.push_back(acc.key);
            setArgs.push_back(std::move(inner));
            accessorCall(setter, setArgs, missingKind, what, acc.loc);
            container = std::move(setArgs[0]);
            return result;
        }
        default:
            break;
    }

    if (acc.isProperty) {
        throw RuntimeError(RuntimeErrorKind::PropertyNotFound,
                           "Property '" + acc.key.asString() + "' not found on " +
                           container.typeName(), acc.loc, acc.key.asString());
    }
    throw typeMismatch("Cannot assign into an index of " + container.typeName(), acc.loc);
}

bool Evaluator::isWritablePlace(const AstNode& target) const {
    const AstNode* root = &target;
    while (root->kind == AstNodeKind::Index || root->kind == AstNodeKind::Property) {
        root = root->children[0].get();
    }
    return root->kind == AstNodeKind::Name && scope_.contains(root->stringValue) &&
           !scope_.isConstant(root->stringValue);
}

Value Evaluator::accessorCall(const std::string& name, std::vector<Value>& args,
                              RuntimeErrorKind missing, const std::string& message,
                              SourceLocation loc) {
    auto* entry = findFunction(name, args, loc);
    if (!entry) throw RuntimeError(missing, message, loc);
    return invoke(*entry, name, args, loc);
}

// -- Index and property access --

Flow Evaluator::evalIndex(const AstNode& node) {
    Flow target = eval(*node.children[0]);
    if (!target.isNormal()) return target;
    Flow index = eval(*node.children[1]);
    if (!index.isNormal()) return index;
    return Flow::normal(indexValue(target.value, index.value, node.loc));
}

Value Evaluator::indexValue(const Value& target, const Value& index, SourceLocation loc) {
    switch (target.type()) {
        case Value::Type::Array: {
            if (!index.isInt()) {
                throw typeMismatch("Array index must be i64, got " + index.typeName(), loc);
            }
            auto& arr = target.asArray();
            return arr[normalizeIndex(index.asInt(), arr.size(), "array", loc)];
        }
        case Value::Type::Map: {
            if (!index.isString()) {
                throw typeMismatch("Map key must be a string, got " + index.typeName(), loc);
            }
            auto& map = target.asMap();
            auto it = map.find(index.asString());
            return it != map.end() ? it->second : Value::unit();
        }
        case Value::Type::String: {
            if (!index.isInt()) {
                throw typeMismatch("String index must be i64, got " + index.typeName(), loc);
            }
            auto& s = target.asString();
            auto offsets = codePointOffsets(s);
            size_t idx = normalizeIndex(index.asInt(), offsets.size(), "string", loc);
            size_t len = 0;
            return Value::character(decodeUtf8(s, offsets[idx], len));
        }
        case Value::Type::Custom: {
            std::vector<Value> args{target, index};
            return accessorCall("index$get", args, RuntimeErrorKind::TypeMismatch,
                                "Cannot index into " + target.typeName(), loc);
        }
        default:
            throw typeMismatch("Cannot index into " + target.typeName(), loc);
    }
}

Flow Evaluator::evalProperty(const AstNode& node) {
    Flow target = eval(*node.children[0]);
    if (!target.isNormal()) return target;
    return Flow::normal(propertyValue(target.value, node.stringValue, node.loc));
}

Value Evaluator::propertyValue(const Value& target, const std::string& name, SourceLocation loc) {
    if (target.isMap()) {
        auto& map = target.asMap();
        auto it = map.find(name);
        return it != map.end() ? it->second : Value::unit();
    }
    std::vector<Value> args{target};
    return accessorCall("get$" + name, args, RuntimeErrorKind::PropertyNotFound,
                        "Property '" + name + "' not found on " + target.typeName(), loc);
}

// -- Calls --

const FunctionEntry* Evaluator::findFunction(const std::string& name,
                                             const std::vector<Value>& args,
                                             SourceLocation loc) const {
    if (library_) {
        if (auto* entry = library_->find(name, args, loc)) return entry;
    }
    return registry_.find(name, args, loc);
}

Flow Evaluator::evalCall(const AstNode& node) {
    std::vector<Value> args;
    args.reserve(node.children.size());
    Flow signal;
    if (!evalArgs(node, 0, args, signal)) return signal;

    const std::string& name = node.stringValue;
    if (auto* entry = findFunction(name, args, node.loc)) {
        return Flow::normal(invoke(*entry, name, args, node.loc));
    }

    // A variable holding a function pointer can be called by name
    if (const Value* var = scope_.lookup(name)) {
        if (var->isFnPtr()) {
            Value fn = *var;
            return Flow::normal(callFunction(fn, std::move(args), node.loc));
        }
    }

    registry_.resolve(name, args, node.loc);  // throws FunctionNotFound
    throw InternalError("resolve() succeeded after find() failed for " + name);
}

Flow Evaluator::evalMethodCall(const AstNode& node) {
    const AstNode& receiverNode = *node.children[0];
    const std::string& name = node.stringValue;

    std::string root;
    std::vector<Accessor> path;
    Flow signal;
    bool place = isWritablePlace(receiverNode);

    std::vector<Value> args;
    args.reserve(node.children.size());
    if (place) {
        if (!collectPath(receiverNode, root, path, signal)) return signal;
        args.push_back(readPlace(root, path, receiverNode.loc));
    } else {
        Flow receiver = eval(receiverNode);
        if (!receiver.isNormal()) return receiver;
        args.push_back(std::move(receiver.value));
    }
    if (!evalArgs(node, 1, args, signal)) return signal;

    const FunctionEntry* entry = findFunction(name, args, node.loc);
    if (!entry) {
        // fp.call(args) and map-held closures: m.action(args)
        Value fn;
        if (name == "call" && args[0].isFnPtr()) {
            fn = args[0];
        } else if (args[0].isMap()) {
            auto& map = args[0].asMap();
            auto it = map.find(name);
            if (it != map.end() && it->second.isFnPtr()) fn = it->second;
        }
        if (fn.isFnPtr()) {
            args.erase(args.begin());
            return Flow::normal(callFunction(fn, std::move(args), node.loc));
        }
        registry_.resolve(name, args, node.loc);  // throws FunctionNotFound
        throw InternalError("resolve() succeeded after find() failed for " + name);
    }

    if (!place || !entry->isNative()) {
        return Flow::normal(invoke(*entry, name, args, node.loc));
    }

    // Native method on a variable: let it mutate the receiver, then store it back.
    if (path.empty()) {
        Value* slot = scope_.lookup(root);
        if (!slot) {
            throw RuntimeError(RuntimeErrorKind::UndefinedVariable,
                               "Undefined variable: " + root, receiverNode.loc, root);
        }
        args[0] = Value();  // drop the extra reference so the native can mutate in place
        VariableLease lease(scope_, root, *slot);
        ReceiverLoan loan(lease.value(), args[0]);
        Value result = invoke(*entry, name, args, node.loc);
        checkSize(args[0], node.loc);
        return Flow::normal(std::move(result));
    }

    Value result = invoke(*entry, name, args, node.loc);
    checkSize(args[0], node.loc);
    updatePlace(root, path, "", args[0], node.loc);
    return Flow::normal(std::move(result));
}

Value Evaluator::invoke(const FunctionEntry& entry, const std::string& name,
                        std::vector<Value>& args, SourceLocation loc) {
    if (entry.script) {
        return callScript(*entry.script, {}, std::move(args), loc);
    }

    tick(loc);
    NativeCallContext ctx(this, name, loc);
    Value result;
    try {
        result = entry.native->call(ctx, args);
    } catch (const RuntimeError& e) {
        throw e.withLocation(loc);
    } catch (const InternalError&) {
        throw;
    } catch (const std::exception& e) {
        throw RuntimeError(RuntimeErrorKind::NativeError,
                           "Function '" + name + "' failed: " + e.what(), loc, name, args.size());
    }
    checkSize(result, loc);
    return result;
}

Value Evaluator::callScript(const ScriptFunction& fn,
                            const std::vector<Capture>& captures,
                            std::vector<Value> args, SourceLocation loc) {
    if (args.size() != fn.params.size()) {
        throw RuntimeError(RuntimeErrorKind::FunctionNotFound,
                           "Function '" + fn.name + "' takes " +
                           std::to_string(fn.params.size()) + " argument(s), got " +
                           std::to_string(args.size()), loc, fn.name, args.size());
    }
    if (dialect_.max_call_depth > 0 && callDepth_ >= dialect_.max_call_depth) {
        throw RuntimeError(RuntimeErrorKind::ResourceLimitExceeded,
                           "Maximum call depth of " + std::to_string(dialect_.max_call_depth) +
                           " exceeded in '" + fn.name + "'", loc, fn.name);
    }
    tick(loc);

    CallDepthGuard depth(callDepth_);
    ScopeFrame frame(scope_);
    for (auto& capture : captures) {
        scope_.defineShared(capture.name, capture.cell, capture.constant);
    }
    for (size_t i = 0; i < args.size(); i++) {
        scope_.define(fn.params[i], std::move(args[i]));
    }

    Flow f = eval(*fn.body);
    switch (f.kind) {
        case FlowKind::Normal:
        case FlowKind::Return:
            return std::move(f.value);
        case FlowKind::Break:
        case FlowKind::Continue:
            throw RuntimeError(RuntimeErrorKind::DanglingLoopControl,
                               std::string(f.kind == FlowKind::Break ? "'break'" : "'continue'") +
                               " escapes function '" + fn.name + "'", f.loc);
    }
    return Value();
}

Value Evaluator::callFunction(const Value& fn, std::vector<Value> args, SourceLocation callSite) {
    if (!fn.isFnPtr()) {
        throw typeMismatch("Cannot call a value of type " + fn.typeName(), callSite);
    }
    auto ptr = fn.fnPtrHandle();
    if (ptr->function) {
        return callScript(*ptr->function, ptr->captures, std::move(args), callSite);
    }
    return callByName(ptr->name, std::move(args), callSite);
}

Value Evaluator::callByName(const std::string& name, std::vector<Value> args,
                            SourceLocation callSite) {
    const FunctionEntry* entry = findFunction(name, args, callSite);
    if (!entry) entry = &registry_.resolve(name, args, callSite);
    return invoke(*entry, name, args, callSite);
}

Flow Evaluator::evalClosure(const AstNode& node) {
    auto ptr = std::make_shared<FnPtr>();
    ptr->name = node.function->name;
    ptr->function = node.function;
    // Captured variables become shared cells, so writes on either side are seen
    for (auto& name : node.function->captures) {
        if (auto cell = scope_.share(name)) {
            ptr->captures.push_back({name, std::move(cell), scope_.isConstant(name)});
        }
    }
    return Flow::normal(Value::fnPtr(std::move(ptr)));
}

// -- Blocks and control flow --

Flow Evaluator::evalBlock(const AstNode& node) {
    ScopeBlock block(scope_);
    Value last;
    for (auto& stmt : node.children) {
        tick(stmt->loc);
        Flow f = eval(*stmt);
        if (!f.isNormal()) return f;
        last = std::move(f.value);
    }
    return Flow::normal(std::move(last));
}

bool Evaluator::conditionValue(const Value& v, const char* what, SourceLocation loc) const {
    if (!v.isBool()) {
        throw typeMismatch(std::string("Condition of '") + what + "' must be bool, got " +
                           v.typeName(), loc);
    }
    return v.asBool();
}

Flow Evaluator::evalIf(const AstNode& node) {
    Flow cond = eval(*node.children[0]);
    if (!cond.isNormal()) return cond;
    if (conditionValue(cond.value, "if", node.children[0]->loc)) {
        return eval(*node.children[1]);
    }
    if (node.hasElse) {
        return eval(*node.children[2]);
    }
    return Flow::normal(Value::unit());
}

Flow Evaluator::evalSwitch(const AstNode& node) {
    Flow scrutinee = eval(*node.children[0]);
    if (!scrutinee.isNormal()) return scrutinee;

    size_t armsEnd = node.children.size() - (node.hasElse ? 1 : 0);
    for (size_t i = 1; i + 1 < armsEnd; i += 2) {
        for (auto& pattern : node.children[i]->children) {
            if (literalValue(*pattern) == scrutinee.value) {
                return eval(*node.children[i + 1]);
            }
        }
    }
    if (node.hasElse) {
        return eval(*node.children.back());
    }
    return Flow::normal(Value::unit());
}

Flow Evaluator::evalWhile(const AstNode& node) {
    while (true) {
        tick(node.loc);
        Flow cond = eval(*node.children[0]);
        if (!cond.isNormal()) return cond;
        if (!conditionValue(cond.value, "while", node.children[0]->loc)) break;

        Flow body = eval(*node.children[1]);
        if (body.kind == FlowKind::Break) break;
        if (body.kind == FlowKind::Return) return body;
    }
    return Flow::normal(Value::unit());
}

Flow Evaluator::evalDoWhile(const AstNode& node) {
    bool isUntil = node.boolValue;
    while (true) {
        tick(node.loc);
        Flow body = eval(*node.children[0]);
        if (body.kind == FlowKind::Break) break;
        if (body.kind == FlowKind::Return) return body;

        Flow cond = eval(*node.children[1]);
        if (!cond.isNormal()) return cond;
        bool value = conditionValue(cond.value, isUntil ? "until" : "while",
                                    node.children[1]->loc);
        if (value == isUntil) break;
    }
    return Flow::normal(Value::unit());
}

Flow Evaluator::evalLoop(const AstNode& node) {
    while (true) {
        tick(node.loc);
        Flow body = eval(*node.children[0]);
        if (body.kind == FlowKind::Break) break;
        if (body.kind == FlowKind::Return) return body;
    }
    return Flow::normal(Value::unit());
}

Flow Evaluator::evalFor(const AstNode& node) {
    const AstNode& iterable = *node.children[0];
    const AstNode& body = *node.children[1];

    Flow result = Flow::normal(Value::unit());
    bool stop = false;

    auto step = [&](Value item, int64_t counter) {
        tick(node.loc);
        ScopeBlock iteration(scope_);
        scope_.define(node.nameParts[0], std::move(item));
        if (node.nameParts.size() > 1) {
            scope_.define(node.nameParts[1], Value::integer(counter));
        }
        Flow f = eval(body);
        if (f.kind == FlowKind::Break) {
            stop = true;
        } else if (f.kind == FlowKind::Return) {
            stop = true;
            result = std::move(f);
        }
    };

    // Ranges are iterated without materializing the array
    if (iterable.kind == AstNodeKind::Range) {
        Flow from = eval(*iterable.children[0]);
        if (!from.isNormal()) return from;
        Flow to = eval(*iterable.children[1]);
        if (!to.isNormal()) return to;
        if (!from.value.isInt() || !to.value.isInt()) {
            throw typeMismatch("Range bounds must be integers, got " + from.value.typeName() +
                               " and " + to.value.typeName(), iterable.loc);
        }
        int64_t start = from.value.asInt();
        int64_t end = to.value.asInt();
        bool inclusive = iterable.boolValue;
        if (start < end || (inclusive && start == end)) {
            int64_t lastValue = inclusive ? end : end - 1;
            int64_t counter = 0;
            for (int64_t i = start; !stop; i++) {
                step(Value::integer(i), counter++);
                if (i == lastValue) break;
            }
        }
        return result;
    }

    Flow source = eval(iterable);
    if (!source.isNormal()) return source;
    Value holder = std::move(source.value);

    switch (holder.type()) {
        case Value::Type::Array: {
            auto& arr = holder.asArray();
            for (size_t i = 0; i < arr.size() && !stop; i++) {
                step(arr[i], static_cast<int64_t>(i));
            }
            break;
        }
        case Value::Type::String: {
            auto& s = holder.asString();
            size_t pos = 0;
            int64_t counter = 0;
            while (pos < s.size() && !stop) {
                size_t len = 0;
                char32_t cp = decodeUtf8(s, pos, len);
                pos += len;
                step(Value::character(cp), counter++);
            }
            break;
        }
        case Value::Type::Map: {
            int64_t counter = 0;
            for (auto& entry : holder.asMap()) {
                if (stop) break;
                step(Value::string(entry.first), counter++);
            }
            break;
        }
        default:
            throw typeMismatch("Cannot iterate over " + holder.typeName(), iterable.loc);
    }
    return result;
}

Flow Evaluator::evalLet(const AstNode& node) {
    Value value;
    if (!node.children.empty()) {
        Flow init = eval(*node.children[0]);
        if (!init.isNormal()) return init;
        value = std::move(init.value);
    }
    if (node.boolValue) {
        scope_.defineConstant(node.nameParts[0], std::move(value));
    } else {
        scope_.define(node.nameParts[0], std::move(value));
    }
    return Flow::normal(Value::unit());
}

Flow Evaluator::evalReturn(const AstNode& node) {
    Value value;
    if (!node.children.empty()) {
        Flow f = eval(*node.children[0]);
        if (!f.isNormal()) return f;
        value = std::move(f.value);
    }
    return {FlowKind::Return, std::move(value), node.loc};
}

// -- Limits --

void Evaluator::tick(SourceLocation loc) {
    operations_++;
    if (dialect_.max_operations > 0 && operations_ > dialect_.max_operations) {
        throw RuntimeError(RuntimeErrorKind::ResourceLimitExceeded,
                           "Operation limit of " + std::to_string(dialect_.max_operations) +
                           " exceeded", loc);
    }
    if (options_.interruptFlag && options_.interruptFlag->load(std::memory_order_relaxed)) {
        throw RuntimeError(RuntimeErrorKind::ExecutionInterrupted,
                           "Execution interrupted by host", loc);
    }
    if (options_.onProgress && !options_.onProgress(operations_)) {
        throw RuntimeError(RuntimeErrorKind::ExecutionInterrupted,
                           "Execution stopped by progress callback after " +
                           std::to_string(operations_) + " operations", loc);
    }
}

void Evaluator::checkSize(const Value& v, SourceLocation loc) const {
    size_t size = 0;
    size_t limit = 0;
    const char* what = nullptr;
    switch (v.type()) {
        case Value::Type::String:
            size = v.asString().size();
            limit = dialect_.max_string_size;
            what = "string";
            break;
        case Value::Type::Array:
            size = v.asArray().size();
            limit = dialect_.max_array_size;
            what = "array";
            break;
        case Value::Type::Map:
            size = v.asMap().size();
            limit = dialect_.max_map_size;
            what = "map";
            break;
        default:
            return;
    }
    if (limit > 0 && size > limit) {
        throw RuntimeError(RuntimeErrorKind::ResourceLimitExceeded,
                           std::string("Size of ") + what + " (" + std::to_string(size) +
                           ") exceeds the limit of " + std::to_string(limit), loc);
    }
}

// -- NativeCallContext --

Value NativeCallContext::callFunction(const Value& fn, std::vector<Value> args) {
    if (!evaluator_) {
        throw RuntimeError(RuntimeErrorKind::NativeError,
                           "No evaluation in progress for callback from '" + functionName_ + "'",
                           callSite_, functionName_);
    }
    return evaluator_->callFunction(fn, std::move(args), callSite_);
}

Value NativeCallContext::callByName(const std::string& name, std::vector<Value> args) {
    if (!evaluator_) {
        throw RuntimeError(RuntimeErrorKind::NativeError,
                           "No evaluation in progress for callback from '" + functionName_ + "'",
                           callSite_, functionName_);
    }
    return evaluator_->callByName(name, std::move(args), callSite_);
}

} // namespace kestrel
