#include "kestrel/scope.h"
#include "kestrel/error.h"
#include <algorithm>

namespace kestrel {

const Scope::Binding* Scope::findBinding(const std::string& name) const {
    for (size_t i = bindings_.size(); i > frameBase_; i--) {
        if (bindings_[i - 1].name == name) return &bindings_[i - 1];
    }
    return nullptr;
}

Scope::Binding* Scope::findBinding(const std::string& name) {
    return const_cast<Binding*>(static_cast<const Scope*>(this)->findBinding(name));
}

std::optional<Value> Scope::get(const std::string& name) const {
    if (auto* b = findBinding(name)) return b->slot();
    return std::nullopt;
}

void Scope::set(const std::string& name, Value value) {
    if (auto* b = findBinding(name)) {
        if (b->constant) {
            throw RuntimeError(RuntimeErrorKind::AssignmentToConstant,
                               "Cannot assign to constant '" + name + "'", SourceLocation{},
                               name);
        }
        b->slot() = std::move(value);
        return;
    }
    define(name, std::move(value));
}

void Scope::define(const std::string& name, Value value) {
    bindings_.push_back({name, std::move(value), false});
}

void Scope::defineConstant(const std::string& name, Value value) {
    bindings_.push_back({name, std::move(value), true});
}

void Scope::defineShared(const std::string& name, std::shared_ptr<Value> cell, bool constant) {
    if (!cell) {
        throw InternalError("Scope::defineShared with a null cell for '" + name + "'");
    }
    bindings_.push_back({name, Value(), constant, std::move(cell)});
}

std::shared_ptr<Value> Scope::share(const std::string& name) {
    auto* b = findBinding(name);
    if (!b) return nullptr;
    if (!b->cell) {
        b->cell = std::make_shared<Value>(std::move(b->value));
    }
    return b->cell;
}

bool Scope::isShared(const std::string& name) const {
    auto* b = findBinding(name);
    return b && b->cell;
}

void Scope::push() {
    marks_.push_back(bindings_.size());
}

void Scope::pop() {
    if (marks_.empty()) {
        throw InternalError("Scope::pop without matching push");
    }
    bindings_.resize(std::max(marks_.back(), frameBase_));
    marks_.pop_back();
}

bool Scope::contains(const std::string& name) const {
    return findBinding(name) != nullptr;
}

bool Scope::isConstant(const std::string& name) const {
    auto* b = findBinding(name);
    return b && b->constant;
}

Value* Scope::lookup(const std::string& name) {
    auto* b = findBinding(name);
    return b ? &b->slot() : nullptr;
}

const Value* Scope::lookup(const std::string& name) const {
    auto* b = findBinding(name);
    return b ? &b->slot() : nullptr;
}

std::vector<std::pair<std::string, Value>> Scope::constants() const {
    std::vector<std::pair<std::string, Value>> result;
    for (size_t i = bindings_.size(); i > frameBase_; i--) {
        auto& b = bindings_[i - 1];
        bool shadowed = std::any_of(result.begin(), result.end(),
                                    [&](const auto& p) { return p.first == b.name; });
        if (shadowed) continue;
        // A later non-constant binding of the same name hides this one
        if (b.constant && findBinding(b.name) == &b) {
            result.emplace_back(b.name, b.slot());
        }
    }
    return result;
}

void Scope::clear() {
    bindings_.clear();
    marks_.clear();
    frameBase_ = 0;
}

// -- ScopeFrame --

ScopeFrame::ScopeFrame(Scope& scope)
    : scope_(scope),
      savedBase_(scope.frameBase_),
      savedSize_(scope.bindings_.size()),
      savedDepth_(scope.marks_.size()) {
    scope_.frameBase_ = savedSize_;
}

ScopeFrame::~ScopeFrame() {
    scope_.bindings_.resize(savedSize_);
    scope_.marks_.resize(savedDepth_);
    scope_.frameBase_ = savedBase_;
}

} // namespace kestrel
