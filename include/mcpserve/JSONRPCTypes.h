//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model, JSON text parsing/serialization and JSON-RPC 2.0 message types
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <memory>
#include <stdexcept>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mcpserve {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   Copies are shallow: children are shared. Code in this library treats values as immutable once built.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsBool() const { return std::holds_alternative<bool>(value); }
    bool IsInteger() const { return std::holds_alternative<int64_t>(value); }
    bool IsNumber() const { return IsInteger() || std::holds_alternative<double>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
    // Strings, numbers, booleans and null
    bool IsScalar() const { return !IsArray() && !IsObject(); }
};

// Deep structural equality (int64 and double are distinct types)
bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

//==========================================================================================================
// JSONParseError
// Purpose: Raised by ParseJSON for malformed input; carries the byte offset where parsing stopped.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what), offset(offset) {}
    std::size_t offset;
};

//==========================================================================================================
// ParseJSON
// Purpose: Strict RFC 8259 parse of a complete JSON text (trailing non-whitespace is rejected).
// Args:
//   text: UTF-8 JSON text.
// Returns:
//   Parsed JSONValue. Integers that fit int64 become int64_t; other numbers become double.
// Throws:
//   JSONParseError on malformed input or nesting deeper than 512 levels.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON / SerializePrettyJSON
// Purpose: Compact single-line serialization, and indented serialization (objects/arrays on multiple
//          lines, `indent` spaces per level). Non-finite doubles serialize as null.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);
std::string SerializePrettyJSON(const JSONValue& value, int indent = 4);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Serializes an id as JSON text ("abc", 7 or null)
std::string SerializeId(const JSONRPCId& id);

// Converts an id to a JSONValue (string, integer or null)
JSONValue IdToJSONValue(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns canonical JSON string for the message.
//   Deserialize(json): Parses JSON string into this object; returns true on success.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
    virtual bool Deserialize(const std::string& json) = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request message with id, method, and optional params.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Ctors:
//   JSONRPCResponse(id, result): Success response with result set.
//   JSONRPCResponse(id, error, /*isError*/): Error response with error set.
// Methods:
//   Serialize()/Deserialize(json)
//   IsError(): True when error is present.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCNotification
// Purpose: JSON-RPC 2.0 notification (no id, no response).
//==========================================================================================================
class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus the lifecycle/transport codes used by the dispatch core.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // Lifecycle and transport codes
    constexpr int UnsupportedProtocolVersion = -32020;
    constexpr int CapabilityNegotiationFailed = -32021;
    constexpr int MessageTooLarge = -32022;
    constexpr int InitializationRequired = -32023;
    constexpr int AlreadyInitialized = -32024;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
// Args:
//   code: Integer error code.
//   message: Human-readable description.
//   data: Optional structured payload; the key is omitted when absent.
// Returns:
//   JSONValue object representing the error.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
// Returns:
//   unique_ptr<JSONRPCResponse> with error populated.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

/////////////////////////////////////////// Shared JSON helpers ///////////////////////////////////////////
// Small accessors used by the handlers and the dispatcher
namespace json {

inline std::shared_ptr<JSONValue> make(JSONValue v) { return std::make_shared<JSONValue>(std::move(v)); }
inline std::shared_ptr<JSONValue> make(const std::string& s) { return std::make_shared<JSONValue>(s); }
inline std::shared_ptr<JSONValue> make(const char* s) { return std::make_shared<JSONValue>(std::string(s)); }

// Member lookup; nullptr when absent or stored as a null pointer
inline const JSONValue* find(const JSONValue::Object& o, const std::string& key) {
    auto it = o.find(key);
    return (it == o.end() || !it->second) ? nullptr : it->second.get();
}

inline std::optional<std::string> getString(const JSONValue::Object& o, const std::string& key) {
    const JSONValue* v = find(o, key);
    if (v == nullptr || !v->IsString()) return std::nullopt;
    return std::get<std::string>(v->value);
}

// Object view of a value; empty object for non-objects
inline JSONValue::Object asObject(const JSONValue& v) {
    return v.IsObject() ? std::get<JSONValue::Object>(v.value) : JSONValue::Object{};
}

} // namespace json

} // namespace mcpserve
