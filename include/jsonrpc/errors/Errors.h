//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error kinds, the RpcError exception and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "jsonrpc/JSONRPCTypes.h"

namespace jsonrpc {
namespace errors {

//==========================================================================================================
// ErrorKind
// Purpose: Distinguishes the ways a library operation can fail.
// Values:
//   Timeout:      the per-call deadline passed before a response arrived.
//   Cancelled:    the caller cancelled the call (stop token or Reply::Cancel).
//   Closed:       the client was shut down or its receive loop ended.
//   Transport:    the transport could not move the bytes.
//   Remote:       the peer answered with a JSON-RPC error object (code/message/data preserved).
//   Decode:       a received value could not be converted to the requested C++ type.
//   Registration: a handler or descriptor was rejected at registration time.
//   InvalidState: an API was used out of order (e.g. joining a reply twice).
//   Config:       a configuration string or option was invalid.
//==========================================================================================================
enum class ErrorKind {
    Timeout,
    Cancelled,
    Closed,
    Transport,
    Remote,
    Decode,
    Registration,
    InvalidState,
    Config
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Timeout:      return "timeout";
        case ErrorKind::Cancelled:    return "cancelled";
        case ErrorKind::Closed:       return "closed";
        case ErrorKind::Transport:    return "transport";
        case ErrorKind::Remote:       return "remote";
        case ErrorKind::Decode:       return "decode";
        case ErrorKind::Registration: return "registration";
        case ErrorKind::InvalidState: return "invalid-state";
        case ErrorKind::Config:       return "config";
    }
    return "unknown";
}

//==========================================================================================================
// RpcError
// Purpose: Exception thrown by every public operation that fails.
// Fields:
//   Kind(): the ErrorKind.
//   Code(): JSON-RPC error code for Remote errors (0 otherwise).
//   Data(): optional structured payload from a remote error object.
//==========================================================================================================
class RpcError : public std::runtime_error {
public:
    RpcError(ErrorKind kind, const std::string& message, int code = 0,
             std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), kind(kind), code(code), data(std::move(data)) {}

    ErrorKind Kind() const noexcept { return kind; }
    int Code() const noexcept { return code; }
    const std::optional<JSONValue>& Data() const noexcept { return data; }

private:
    ErrorKind kind;
    int code;
    std::optional<JSONValue> data;
};

// Constructors for each kind
inline RpcError Timeout(const std::string& message) { return RpcError(ErrorKind::Timeout, message); }
inline RpcError Cancelled(const std::string& message) { return RpcError(ErrorKind::Cancelled, message); }
inline RpcError Closed(const std::string& message) { return RpcError(ErrorKind::Closed, message); }
inline RpcError TransportFailure(const std::string& message) { return RpcError(ErrorKind::Transport, message); }
inline RpcError Decode(const std::string& message) { return RpcError(ErrorKind::Decode, message); }
inline RpcError Registration(const std::string& message) { return RpcError(ErrorKind::Registration, message); }
inline RpcError InvalidState(const std::string& message) { return RpcError(ErrorKind::InvalidState, message); }
inline RpcError Config(const std::string& message) { return RpcError(ErrorKind::Config, message); }
inline RpcError Remote(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt) {
    return RpcError(ErrorKind::Remote, message, code, std::move(data));
}
inline RpcError Remote(const JSONRPCError& err) { return Remote(err.code, err.message, err.data); }

// Categorization of reserved JSON-RPC error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    JsonRpcServer,
    Unknown
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code. Codes in the implementation-defined server range
//   (-32099..-32000) map to JsonRpcServer; anything else unmapped is Unknown.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        default: break;
    }
    if (code <= JSONRPCErrorCodes::ServerError && code >= -32099) {
        return ErrorCategory::JsonRpcServer;
    }
    return ErrorCategory::Unknown;
}

// Wire error for an RpcError raised by a handler. Remote errors keep code and data; every other kind is an
// InternalError carrying the message.
inline JSONRPCError toWireError(const RpcError& err) {
    if (err.Kind() == ErrorKind::Remote) {
        return JSONRPCError{err.Code(), err.what(), err.Data()};
    }
    return JSONRPCError{JSONRPCErrorCodes::InternalError, err.what(), std::nullopt};
}

// Extract the typed error from a response if it carries one. An error member that is not a well-formed
// error object is reported as an InternalError.
inline std::optional<JSONRPCError> errorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    auto parsed = ParseErrorObject(response.error.value());
    if (!parsed.has_value()) {
        return JSONRPCError{JSONRPCErrorCodes::InternalError, "malformed error object in response", std::nullopt};
    }
    return parsed;
}

} // namespace errors
} // namespace jsonrpc
