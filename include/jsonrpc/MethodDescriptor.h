//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodDescriptor.h
// Purpose: Typed handler descriptors stored in the dispatch registry
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "jsonrpc/CallContext.h"
#include "jsonrpc/JSONRPCTypes.h"
#include "jsonrpc/Status.h"

namespace jsonrpc {

//==========================================================================================================
// ParamDescriptor
// Purpose: One positional input of a handler.
// Fields:
//   kind: expected JSON kind (Number also accepts integers; Any accepts everything).
//   optional: when true the argument may be omitted (trailing) or null and binds as absent.
//==========================================================================================================
struct ParamDescriptor {
    ValueKind kind{ValueKind::Any};
    bool optional{false};
};

//==========================================================================================================
// HandlerResult
// Purpose: What a handler produced: its error slot plus the encoded leading return values.
//==========================================================================================================
struct HandlerResult {
    Status status;
    std::vector<JSONValue> outputs;
};

//==========================================================================================================
// ArgumentError
// Purpose: Raised by invokers when the argument at Index() cannot be decoded.
//==========================================================================================================
class ArgumentError : public std::runtime_error {
public:
    ArgumentError(std::size_t index, const std::string& message)
        : std::runtime_error(message), index(index) {}
    std::size_t Index() const noexcept { return index; }

private:
    std::size_t index;
};

//==========================================================================================================
// MethodDescriptor
// Purpose: Everything the dispatcher needs to bind and call one method.
// Fields:
//   name:    RPC method name.
//   params:  ordered input descriptors; optional params must all be trailing.
//   outputs: ordered output kinds; the last entry must be ValueKind::Error.
//   invoker: receives the per-dispatch context and one pointer per declared param (nullptr when absent),
//            already arity- and kind-checked. Throws ArgumentError for per-element decode failures.
//==========================================================================================================
struct MethodDescriptor {
    using Invoker = std::function<HandlerResult(const CallContext&, const std::vector<const JSONValue*>&)>;

    std::string name;
    std::vector<ParamDescriptor> params;
    std::vector<ValueKind> outputs;
    Invoker invoker;
};

} // namespace jsonrpc
