//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 envelope types (request, notification, response, error)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

#include "jsonrpc/version.h"

namespace jsonrpc {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
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
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }

    // Returns the member named key, or nullptr when this is not an object or the key is absent.
    const JSONValue* Find(const std::string& key) const;
};

// Structural equality (numbers compare by value across int64/double).
bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document.
// Args:
//   json: UTF-8 text holding exactly one JSON value (surrounding whitespace allowed).
// Returns:
//   The parsed value. Throws std::runtime_error describing the first syntax error.
//==========================================================================================================
JSONValue ParseJSON(const std::string& json);

//==========================================================================================================
// SerializeJSON
// Purpose: Serializes a value to compact JSON text.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// ValueKind
// Purpose: Coarse JSON kind used by handler parameter/output descriptors.
// Notes:
//   Any accepts every JSON value. Error is only legal as the trailing output of a handler.
//==========================================================================================================
enum class ValueKind {
    Null,
    Bool,
    Integer,
    Number,
    String,
    Array,
    Object,
    Any,
    Error
};

const char* ValueKindName(ValueKind kind);

// Kind of a concrete JSON value (never Any or Error).
ValueKind KindOf(const JSONValue& value);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

std::string IdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns the JSON text for the message.
//   Deserialize(json): Parses JSON text into this object; returns true when the text is a valid envelope
//                      of this message type.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = kProtocolVersion;

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
    virtual bool Deserialize(const std::string& json) = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request message with id, method, and optional positional params.
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
    bool FromJSON(const JSONValue& doc);
    JSONValue ToJSON() const;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Ctors:
//   JSONRPCResponse(id, result): Success response with result set.
//   JSONRPCResponse(id, error, /*isError*/): Error response with error set.
// Notes:
//   Deserialize rejects documents carrying both or neither of result/error.
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
    bool FromJSON(const JSONValue& doc);
    JSONValue ToJSON() const;

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
    bool FromJSON(const JSONValue& doc);
    JSONValue ToJSON() const;
};

//==========================================================================================================
// BatchResponses
// Purpose: Ordered list of responses as it appears on the wire (a JSON array).
// Notes:
//   Only the wire shape is provided; the dispatcher does not execute batches.
//==========================================================================================================
using BatchResponses = std::vector<JSONRPCResponse>;

std::string SerializeBatch(const BatchResponses& batch);
bool DeserializeBatch(const std::string& json, BatchResponses& out);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Reserved JSON-RPC error codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
    constexpr int ServerError = -32000;
}

//==========================================================================================================
// JSONRPCError
// Purpose: Typed view of a JSON-RPC error object { code, message, data? }.
//==========================================================================================================
struct JSONRPCError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
// Args:
//   code: Integer error code.
//   message: Human-readable description.
//   data: Optional structured payload.
// Returns:
//   JSONValue object representing the error.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// ParseErrorObject
// Purpose: Reads { code, message, data? } back into a JSONRPCError.
// Returns:
//   std::nullopt when the value does not have the error object shape.
//==========================================================================================================
std::optional<JSONRPCError> ParseErrorObject(const JSONValue& errVal);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace jsonrpc
