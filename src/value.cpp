#include "kestrel/value.h"
#include "kestrel/error.h"
#include "kestrel/host_object.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace kestrel {

// -- SourceLocation --

std::string SourceLocation::toString() const {
    return std::to_string(line) + ":" + std::to_string(column);
}

// -- Value static factories --

Value Value::unit() { return Value(); }

Value Value::boolean(bool b) {
    Value v;
    v.data_ = b;
    return v;
}

Value Value::integer(int64_t i) {
    Value v;
    v.data_ = i;
    return v;
}

Value Value::number(double d) {
    Value v;
    v.data_ = d;
    return v;
}

Value Value::character(char32_t c) {
    Value v;
    v.data_ = c;
    return v;
}

Value Value::string(std::string s) {
    Value v;
    v.data_ = std::make_shared<std::string>(std::move(s));
    return v;
}

Value Value::array(Array elems) {
    Value v;
    v.data_ = std::make_shared<Array>(std::move(elems));
    return v;
}

Value Value::map(Map entries) {
    Value v;
    v.data_ = std::make_shared<Map>(std::move(entries));
    return v;
}

Value Value::fnPtr(std::shared_ptr<const FnPtr> f) {
    Value v;
    v.data_ = std::move(f);
    return v;
}

Value Value::custom(std::shared_ptr<HostObject> obj) {
    Value v;
    v.data_ = std::move(obj);
    return v;
}

// -- Accessors --

static RuntimeError mismatch(const char* wanted, const Value& got) {
    return RuntimeError(RuntimeErrorKind::TypeMismatch,
                        std::string("Value is not ") + wanted + ", got " + got.typeName(),
                        SourceLocation{});
}

// Detach shared storage before handing out a mutable reference.
template <typename T>
static T& detach(std::shared_ptr<T>& p) {
    if (p.use_count() > 1) {
        p = std::make_shared<T>(*p);
    }
    return *p;
}

bool Value::asBool() const {
    if (auto* p = std::get_if<bool>(&data_)) return *p;
    throw mismatch("a bool", *this);
}

int64_t Value::asInt() const {
    if (auto* p = std::get_if<int64_t>(&data_)) return *p;
    throw mismatch("an integer", *this);
}

double Value::asFloat() const {
    if (auto* p = std::get_if<double>(&data_)) return *p;
    throw mismatch("a float", *this);
}

double Value::asNumber() const {
    if (auto* p = std::get_if<int64_t>(&data_)) return static_cast<double>(*p);
    if (auto* p = std::get_if<double>(&data_)) return *p;
    throw mismatch("numeric", *this);
}

char32_t Value::asChar() const {
    if (auto* p = std::get_if<char32_t>(&data_)) return *p;
    throw mismatch("a char", *this);
}

const std::string& Value::asString() const {
    if (auto* p = std::get_if<std::shared_ptr<std::string>>(&data_)) return **p;
    throw mismatch("a string", *this);
}

std::string& Value::asStringMut() {
    if (auto* p = std::get_if<std::shared_ptr<std::string>>(&data_)) return detach(*p);
    throw mismatch("a string", *this);
}

const Array& Value::asArray() const {
    if (auto* p = std::get_if<std::shared_ptr<Array>>(&data_)) return **p;
    throw mismatch("an array", *this);
}

Array& Value::asArrayMut() {
    if (auto* p = std::get_if<std::shared_ptr<Array>>(&data_)) return detach(*p);
    throw mismatch("an array", *this);
}

const Map& Value::asMap() const {
    if (auto* p = std::get_if<std::shared_ptr<Map>>(&data_)) return **p;
    throw mismatch("a map", *this);
}

Map& Value::asMapMut() {
    if (auto* p = std::get_if<std::shared_ptr<Map>>(&data_)) return detach(*p);
    throw mismatch("a map", *this);
}

const FnPtr& Value::asFnPtr() const {
    if (auto* p = std::get_if<std::shared_ptr<const FnPtr>>(&data_)) return **p;
    throw mismatch("a function pointer", *this);
}

std::shared_ptr<const FnPtr> Value::fnPtrHandle() const {
    if (auto* p = std::get_if<std::shared_ptr<const FnPtr>>(&data_)) return *p;
    throw mismatch("a function pointer", *this);
}

HostObject& Value::asCustom() const {
    if (auto* p = std::get_if<std::shared_ptr<HostObject>>(&data_)) return **p;
    throw mismatch("a host object", *this);
}

std::shared_ptr<HostObject> Value::customHandle() const {
    if (auto* p = std::get_if<std::shared_ptr<HostObject>>(&data_)) return *p;
    throw mismatch("a host object", *this);
}

// -- Equality --

bool Value::operator==(const Value& other) const {
    if (type() != other.type()) return false;

    switch (type()) {
        case Type::Unit: return true;
        case Type::Bool: return asBool() == other.asBool();
        case Type::Int: return asInt() == other.asInt();
        case Type::Float: return asFloat() == other.asFloat();
        case Type::Char: return asChar() == other.asChar();
        case Type::String: return asString() == other.asString();
        case Type::Array: return asArray() == other.asArray();
        case Type::Map: return asMap() == other.asMap();
        case Type::FnPtr: {
            auto& a = asFnPtr();
            auto& b = other.asFnPtr();
            if (&a == &b) return true;
            if (a.function != b.function || a.name != b.name ||
                a.captures.size() != b.captures.size()) {
                return false;
            }
            for (size_t i = 0; i < a.captures.size(); i++) {
                if (a.captures[i].cell != b.captures[i].cell) return false;
            }
            return true;
        }
        case Type::Custom:
            return asCustom().equals(other.asCustom());
    }
    return false;
}

// -- Display --

const char* Value::typeName(Type type) {
    switch (type) {
        case Type::Unit: return "()";
        case Type::Bool: return "bool";
        case Type::Int: return "i64";
        case Type::Float: return "f64";
        case Type::Char: return "char";
        case Type::String: return "string";
        case Type::Array: return "array";
        case Type::Map: return "map";
        case Type::FnPtr: return "Fn";
        case Type::Custom: return "custom";
    }
    return "unknown";
}

std::string Value::typeName() const {
    if (isCustom()) return asCustom().typeName();
    return typeName(type());
}

std::string formatFloat(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%.15g", d);
    if (std::strtod(buf, nullptr) != d) {
        std::snprintf(buf, sizeof(buf), "%.17g", d);
    }
    std::string s(buf);
    if (s.find_first_of(".eE") == std::string::npos) {
        s += ".0";
    }
    return s;
}

void appendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string quoteString(const std::string& s, char quote) {
    std::string result(1, quote);
    for (char c : s) {
        switch (c) {
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            case '\0': result += "\\0"; break;
            case '\\': result += "\\\\"; break;
            case '"': result += quote == '"' ? "\\\"" : "\""; break;
            case '\'': result += quote == '\'' ? "\\'" : "'"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    result += quote;
    return result;
}

static bool isPlainIdentifier(const std::string& s) {
    if (s.empty() || std::isdigit(static_cast<unsigned char>(s[0]))) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

std::string Value::toString() const {
    switch (type()) {
        case Type::Unit: return "()";
        case Type::Bool: return asBool() ? "true" : "false";
        case Type::Int: return std::to_string(asInt());
        case Type::Float: return formatFloat(asFloat());
        case Type::Char: {
            std::string s;
            appendUtf8(s, asChar());
            return s;
        }
        case Type::String: return asString();
        case Type::Array: {
            std::string result = "[";
            auto& arr = asArray();
            for (size_t i = 0; i < arr.size(); i++) {
                if (i > 0) result += ", ";
                result += arr[i].debugString();
            }
            result += "]";
            return result;
        }
        case Type::Map: {
            std::string result = "#{";
            bool first = true;
            for (auto& [key, val] : asMap()) {
                if (!first) result += ", ";
                first = false;
                result += isPlainIdentifier(key) ? key : quoteString(key);
                result += ": ";
                result += val.debugString();
            }
            result += "}";
            return result;
        }
        case Type::FnPtr: return "Fn(" + asFnPtr().name + ")";
        case Type::Custom: return asCustom().toString();
    }
    return "<unknown>";
}

std::string Value::debugString() const {
    if (isString()) return quoteString(asString());
    if (isChar()) return quoteString(toString(), '\'');
    return toString();
}

} // namespace kestrel
