#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace kestrel {

// Forward declarations
class HostObject;
struct FnPtr;
struct ScriptFunction;
class Value;

using Array = std::vector<Value>;
using Map = std::map<std::string, Value>;

/// The universal value type in kestrel.
///
/// Strings, arrays and maps are shared copy-on-write: copying a Value is cheap,
/// and the mutable accessors detach the storage first, so a write through one
/// binding is never visible through another. Host objects are shared by
/// reference; aliasing them is up to the host type.
class Value {
public:
    enum class Type : std::size_t {
        Unit = 0,
        Bool,
        Int,
        Float,
        Char,
        String,
        Array,
        Map,
        FnPtr,
        Custom
    };

    /// Default constructs unit.
    Value() : data_(std::monostate{}) {}

    // A moved-from Value is unit, never a null handle.
    Value(const Value&) = default;
    Value& operator=(const Value&) = default;
    Value(Value&& other) noexcept : data_(std::move(other.data_)) { other.data_ = std::monostate{}; }
    Value& operator=(Value&& other) noexcept {
        if (this != &other) {
            data_ = std::move(other.data_);
            other.data_ = std::monostate{};
        }
        return *this;
    }

    // -- Static factories --
    static Value unit();
    static Value boolean(bool b);
    static Value integer(int64_t i);
    static Value number(double d);
    static Value character(char32_t c);
    static Value string(std::string s);
    static Value array(Array elems);
    static Value map(Map entries = {});
    static Value fnPtr(std::shared_ptr<const FnPtr> f);
    static Value custom(std::shared_ptr<HostObject> obj);

    // -- Type queries --
    Type type() const { return static_cast<Type>(data_.index()); }
    bool isUnit() const { return type() == Type::Unit; }
    bool isBool() const { return type() == Type::Bool; }
    bool isInt() const { return type() == Type::Int; }
    bool isFloat() const { return type() == Type::Float; }
    bool isNumeric() const { return isInt() || isFloat(); }
    bool isChar() const { return type() == Type::Char; }
    bool isString() const { return type() == Type::String; }
    bool isArray() const { return type() == Type::Array; }
    bool isMap() const { return type() == Type::Map; }
    bool isFnPtr() const { return type() == Type::FnPtr; }
    bool isCustom() const { return type() == Type::Custom; }

    // -- Accessors (throw RuntimeError TypeMismatch on the wrong type) --
    bool asBool() const;
    int64_t asInt() const;
    double asFloat() const;
    double asNumber() const;  // works for int or float
    char32_t asChar() const;
    const std::string& asString() const;
    std::string& asStringMut();
    const Array& asArray() const;
    Array& asArrayMut();
    const Map& asMap() const;
    Map& asMapMut();
    const FnPtr& asFnPtr() const;
    std::shared_ptr<const FnPtr> fnPtrHandle() const;
    HostObject& asCustom() const;
    std::shared_ptr<HostObject> customHandle() const;

    /// Downcast a host object; nullptr if this is not a T.
    template <typename T>
    T* customAs() const {
        if (!isCustom()) return nullptr;
        return dynamic_cast<T*>(&asCustom());
    }

    // -- Equality (same type required; containers compare deeply) --
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // -- Display --
    std::string toString() const;
    /// Like toString() but strings and chars are quoted and escaped.
    std::string debugString() const;
    std::string typeName() const;
    static const char* typeName(Type type);

private:
    using Variant = std::variant<
        std::monostate,                   // Unit
        bool,                             // Bool
        int64_t,                          // Int
        double,                           // Float
        char32_t,                         // Char
        std::shared_ptr<std::string>,     // String
        std::shared_ptr<Array>,           // Array
        std::shared_ptr<Map>,             // Map
        std::shared_ptr<const FnPtr>,     // FnPtr
        std::shared_ptr<HostObject>       // Custom
    >;
    Variant data_;
};

/// Function pointer: a script function plus the values it captured when created.
/// With no function attached, calls go through name resolution instead.
/// A variable a closure shares with the scope it was created in.
struct Capture {
    std::string name;
    std::shared_ptr<Value> cell;
    bool constant = false;
};

struct FnPtr {
    std::string name;
    std::shared_ptr<const ScriptFunction> function;
    std::vector<Capture> captures;
};

/// Shortest round-tripping text for a float; always contains '.', 'e' or is non-finite.
std::string formatFloat(double d);

/// Append a code point as UTF-8.
void appendUtf8(std::string& out, char32_t cp);

/// Quote and escape a string the way the lexer reads it back.
std::string quoteString(const std::string& s, char quote = '"');

} // namespace kestrel
