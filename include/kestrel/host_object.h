#pragma once

#include <string>

namespace kestrel {

/// Opaque host type carried inside a Value. Scripts can pass it around, compare
/// it and hand it to native functions; only the host knows what is inside.
class HostObject {
public:
    virtual ~HostObject() = default;

    virtual std::string typeName() const = 0;
    virtual std::string toString() const { return "<" + typeName() + ">"; }

    /// Identity by default.
    virtual bool equals(const HostObject& other) const { return this == &other; }
};

} // namespace kestrel
