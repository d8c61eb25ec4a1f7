#include "kestrel/function_registry.h"
#include "kestrel/ast.h"
#include "kestrel/error.h"
#include <spdlog/spdlog.h>

namespace kestrel {

// -- FunctionSignature --

FunctionSignature FunctionSignature::untyped(std::string name, size_t arity) {
    return FunctionSignature(std::move(name), std::vector<ParamType>(arity, std::nullopt));
}

size_t FunctionSignature::typedCount() const {
    size_t n = 0;
    for (auto& p : params) {
        if (p) n++;
    }
    return n;
}

bool FunctionSignature::accepts(const std::vector<Value>& args) const {
    if (variadic ? args.size() < params.size() : args.size() != params.size()) {
        return false;
    }
    for (size_t i = 0; i < params.size(); i++) {
        if (params[i] && *params[i] != args[i].type()) return false;
    }
    return true;
}

bool FunctionSignature::operator==(const FunctionSignature& other) const {
    return name == other.name && params == other.params && variadic == other.variadic;
}

std::string FunctionSignature::toString() const {
    std::string result = name + "(";
    for (size_t i = 0; i < params.size(); i++) {
        if (i > 0) result += ", ";
        result += params[i] ? Value::typeName(*params[i]) : "any";
    }
    if (variadic) result += params.empty() ? "..." : ", ...";
    result += ")";
    return result;
}

// -- FunctionRegistry --

void FunctionRegistry::insert(FunctionEntry entry) {
    auto& overloads = functions_[entry.signature.name];
    for (auto& existing : overloads) {
        if (existing.signature == entry.signature) {
            spdlog::debug("kestrel: function {} overridden", entry.signature.toString());
            existing = std::move(entry);
            return;
        }
    }
    overloads.push_back(std::move(entry));
}

void FunctionRegistry::registerFunction(FunctionSignature sig,
                                        std::shared_ptr<NativeFunctionObject> fn, bool pure) {
    if (!fn) {
        throw InternalError("registerFunction: null callable for " + sig.toString());
    }
    FunctionEntry entry;
    entry.signature = std::move(sig);
    entry.native = std::move(fn);
    entry.pure = pure;
    insert(std::move(entry));
}

void FunctionRegistry::registerNative(const std::string& name, std::vector<ParamType> types,
                                      SimpleLambdaFunction::Func fn, bool pure) {
    registerFunction(FunctionSignature(name, std::move(types)),
                     std::make_shared<SimpleLambdaFunction>(std::move(fn)), pure);
}

void FunctionRegistry::registerScript(std::shared_ptr<const ScriptFunction> fn) {
    FunctionEntry entry;
    entry.signature = FunctionSignature::untyped(fn->name, fn->params.size());
    entry.script = std::move(fn);
    insert(std::move(entry));
}

static std::string describeCall(const std::string& name, const std::vector<Value>& args) {
    std::string result = name + "(";
    for (size_t i = 0; i < args.size(); i++) {
        if (i > 0) result += ", ";
        result += args[i].typeName();
    }
    return result + ")";
}

const FunctionEntry* FunctionRegistry::find(const std::string& name,
                                            const std::vector<Value>& args,
                                            SourceLocation loc) const {
    auto it = functions_.find(name);
    if (it == functions_.end()) return nullptr;
    const auto& overloads = it->second;

    // Picks the candidate with the most typed parameters among those the
    // filter admits; two at the top is ambiguous.
    auto pickBest = [&](auto admit) -> const FunctionEntry* {
        const FunctionEntry* best = nullptr;
        const FunctionEntry* rival = nullptr;
        for (auto& entry : overloads) {
            if (!admit(entry.signature) || !entry.signature.accepts(args)) continue;
            if (!best || entry.signature.typedCount() > best->signature.typedCount()) {
                best = &entry;
                rival = nullptr;
            } else if (entry.signature.typedCount() == best->signature.typedCount()) {
                rival = &entry;
            }
        }
        if (rival) {
            throw RuntimeError(RuntimeErrorKind::AmbiguousFunction,
                               "Ambiguous call " + describeCall(name, args) + ": both " +
                               best->signature.toString() + " and " +
                               rival->signature.toString() + " match",
                               loc, name, args.size());
        }
        return best;
    };

    // Tier 1: fully typed exact match
    for (auto& entry : overloads) {
        const auto& sig = entry.signature;
        if (!sig.variadic && sig.typedCount() == sig.arity() && sig.accepts(args)) {
            return &entry;
        }
    }

    // Tier 2: fixed arity with at least one "any" parameter
    if (auto* entry = pickBest([](const FunctionSignature& s) { return !s.variadic; })) {
        return entry;
    }

    // Tier 3: variadic
    return pickBest([](const FunctionSignature& s) { return s.variadic; });
}

const FunctionEntry& FunctionRegistry::resolve(const std::string& name,
                                               const std::vector<Value>& args,
                                               SourceLocation loc) const {
    if (auto* entry = find(name, args, loc)) return *entry;
    throw RuntimeError(RuntimeErrorKind::FunctionNotFound,
                       "Function not found: " + describeCall(name, args), loc, name,
                       args.size());
}

bool FunctionRegistry::contains(const std::string& name) const {
    return functions_.count(name) > 0;
}

bool FunctionRegistry::contains(const std::string& name, size_t arity) const {
    auto it = functions_.find(name);
    if (it == functions_.end()) return false;
    for (auto& entry : it->second) {
        if (entry.signature.arity() == arity && !entry.signature.variadic) return true;
    }
    return false;
}

size_t FunctionRegistry::size() const {
    size_t n = 0;
    for (auto& [name, overloads] : functions_) {
        n += overloads.size();
    }
    return n;
}

std::vector<const FunctionEntry*> FunctionRegistry::functions(const std::string& name) const {
    std::vector<const FunctionEntry*> result;
    auto it = functions_.find(name);
    if (it != functions_.end()) {
        for (auto& entry : it->second) {
            result.push_back(&entry);
        }
    }
    return result;
}

void registerFunction(FunctionRegistry& registry, FunctionSignature sig,
                      SimpleLambdaFunction::Func fn, bool pure) {
    registry.registerFunction(std::move(sig),
                              std::make_shared<SimpleLambdaFunction>(std::move(fn)), pure);
}

} // namespace kestrel
