#pragma once

#include "source_location.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kestrel {

class Value;
class Evaluator;

/// What a native callable sees of the call that invoked it.
class NativeCallContext {
public:
    NativeCallContext(Evaluator* evaluator, std::string functionName, SourceLocation callSite)
        : evaluator_(evaluator), functionName_(std::move(functionName)), callSite_(callSite) {}

    const std::string& functionName() const { return functionName_; }
    SourceLocation callSite() const { return callSite_; }

    /// False while the optimizer folds a pure call at compile time.
    bool hasEvaluator() const { return evaluator_ != nullptr; }

    /// Call a function pointer value back through the running evaluation.
    Value callFunction(const Value& fn, std::vector<Value> args);

    /// Resolve and call a function by name, as a script call would.
    Value callByName(const std::string& name, std::vector<Value> args);

private:
    Evaluator* evaluator_;
    std::string functionName_;
    SourceLocation callSite_;
};

/// A native function object -- a C++ object with state and a callable method.
/// Arguments arrive by mutable reference; for a method call `x.f()` the first
/// argument is written back to `x` afterwards.
class NativeFunctionObject {
public:
    virtual ~NativeFunctionObject() = default;
    virtual Value call(NativeCallContext& ctx, std::vector<Value>& args) = 0;
};

/// Convenience: wrap a std::function as a NativeFunctionObject.
class SimpleLambdaFunction : public NativeFunctionObject {
public:
    using Func = std::function<Value(NativeCallContext&, std::vector<Value>&)>;

    explicit SimpleLambdaFunction(Func fn) : fn_(std::move(fn)) {}

    Value call(NativeCallContext& ctx, std::vector<Value>& args) override;

private:
    Func fn_;
};

} // namespace kestrel
