#pragma once

#include "native_function.h"
#include "source_location.h"
#include "value.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kestrel {

struct ScriptFunction;

/// A parameter constraint: a concrete value type, or std::nullopt for "any".
using ParamType = std::optional<Value::Type>;

struct FunctionSignature {
    std::string name;
    std::vector<ParamType> params;
    // Variadic signatures accept any number of trailing untyped arguments.
    bool variadic = false;

    FunctionSignature() = default;
    FunctionSignature(std::string n, std::vector<ParamType> p, bool isVariadic = false)
        : name(std::move(n)), params(std::move(p)), variadic(isVariadic) {}

    /// All-any signature of the given arity.
    static FunctionSignature untyped(std::string name, size_t arity);

    size_t arity() const { return params.size(); }
    size_t typedCount() const;
    bool accepts(const std::vector<Value>& args) const;
    bool operator==(const FunctionSignature& other) const;

    /// e.g. "add(i64, any)"
    std::string toString() const;
};

/// One registered overload: either a native callable or a script function.
struct FunctionEntry {
    FunctionSignature signature;
    std::shared_ptr<NativeFunctionObject> native;
    std::shared_ptr<const ScriptFunction> script;
    // Pure natives may be folded at compile time when their arguments are literals.
    bool pure = false;

    bool isNative() const { return native != nullptr; }
};

/// Name/arity/type-indexed table of callables with deterministic overload
/// resolution. Not thread-safe for registration; concurrent resolve() calls
/// are fine once registration is done.
class FunctionRegistry {
public:
    FunctionRegistry() = default;

    /// Register under an explicit signature. An identical signature replaces
    /// the earlier entry.
    void registerFunction(FunctionSignature sig, std::shared_ptr<NativeFunctionObject> fn,
                          bool pure = false);

    void registerNative(const std::string& name, std::vector<ParamType> types,
                        SimpleLambdaFunction::Func fn, bool pure = false);

    void registerScript(std::shared_ptr<const ScriptFunction> fn);

    /// Pick the overload for a call.
    ///   1. every parameter typed and matching;
    ///   2. otherwise the matching candidate with the most typed parameters,
    ///      a tie at the top is AmbiguousFunction;
    ///   3. otherwise the best variadic candidate, ranked the same way.
    /// Returns nullptr when nothing matches.
    const FunctionEntry* find(const std::string& name, const std::vector<Value>& args,
                              SourceLocation loc = {}) const;

    /// Like find(), but a miss is FunctionNotFound{name, arity}.
    const FunctionEntry& resolve(const std::string& name, const std::vector<Value>& args,
                                 SourceLocation loc = {}) const;

    bool contains(const std::string& name) const;
    bool contains(const std::string& name, size_t arity) const;
    size_t size() const;
    std::vector<const FunctionEntry*> functions(const std::string& name) const;
    void clear() { functions_.clear(); }

private:
    std::map<std::string, std::vector<FunctionEntry>> functions_;

    void insert(FunctionEntry entry);
};

/// Free-function form of FunctionRegistry::registerNative for a signature.
void registerFunction(FunctionRegistry& registry, FunctionSignature sig,
                      SimpleLambdaFunction::Func fn, bool pure = false);

} // namespace kestrel
