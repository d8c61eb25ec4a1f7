#pragma once

#include "value.h"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kestrel {

/// Ordered variable bindings with nested blocks and shadowing.
///
/// Bindings live in one flat vector; push() records a block mark and pop()
/// truncates back to it. Lookup scans from the newest binding backwards, so
/// the innermost match wins. A function call opens a frame (ScopeFrame):
/// lookups never see bindings below the frame base.
///
/// A binding captured by a closure is converted to a shared cell; the closure
/// and the scope then read and write the same value.
class Scope {
public:
    Scope() = default;

    std::optional<Value> get(const std::string& name) const;

    /// Update the innermost visible binding, or define a new one in the
    /// current block. Throws AssignmentToConstant for a constant binding.
    void set(const std::string& name, Value value);

    /// Always introduces a new binding in the current block (shadowing).
    void define(const std::string& name, Value value);
    void defineConstant(const std::string& name, Value value);
    /// Bind `name` to an existing shared cell.
    void defineShared(const std::string& name, std::shared_ptr<Value> cell, bool constant);

    /// Turn the innermost visible binding into a shared cell and return it.
    /// Returns nullptr if `name` is not bound.
    std::shared_ptr<Value> share(const std::string& name);
    bool isShared(const std::string& name) const;

    void push();
    void pop();

    /// Number of open blocks.
    size_t depth() const { return marks_.size(); }
    /// Number of live bindings, shadowed ones included.
    size_t size() const { return bindings_.size(); }

    bool contains(const std::string& name) const;
    bool isConstant(const std::string& name) const;

    /// Pointer to the innermost visible binding, nullptr if absent. Invalidated
    /// by any define or pop.
    Value* lookup(const std::string& name);
    const Value* lookup(const std::string& name) const;

    /// Visible constant bindings, innermost first, one per name.
    std::vector<std::pair<std::string, Value>> constants() const;

    void clear();

private:
    friend class ScopeFrame;

    struct Binding {
        std::string name;
        Value value;
        bool constant = false;
        std::shared_ptr<Value> cell;  // set once captured

        Value& slot() { return cell ? *cell : value; }
        const Value& slot() const { return cell ? *cell : value; }
    };

    std::vector<Binding> bindings_;
    std::vector<size_t> marks_;
    size_t frameBase_ = 0;

    const Binding* findBinding(const std::string& name) const;
    Binding* findBinding(const std::string& name);
};

/// RAII block: push on construction, pop on every exit path.
class ScopeBlock {
public:
    explicit ScopeBlock(Scope& scope) : scope_(scope) { scope_.push(); }
    ~ScopeBlock() { scope_.pop(); }

    ScopeBlock(const ScopeBlock&) = delete;
    ScopeBlock& operator=(const ScopeBlock&) = delete;

private:
    Scope& scope_;
};

/// RAII function frame: hides the caller's bindings and discards everything
/// the callee defined when it ends.
class ScopeFrame {
public:
    explicit ScopeFrame(Scope& scope);
    ~ScopeFrame();

    ScopeFrame(const ScopeFrame&) = delete;
    ScopeFrame& operator=(const ScopeFrame&) = delete;

private:
    Scope& scope_;
    size_t savedBase_;
    size_t savedSize_;
    size_t savedDepth_;
};

} // namespace kestrel
