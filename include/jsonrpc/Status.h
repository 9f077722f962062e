//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Status.h
// Purpose: Handler error slot; the last return value of every registered method
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "jsonrpc/JSONRPCTypes.h"

namespace jsonrpc {

//==========================================================================================================
// Status
// Purpose: Outcome reported by a handler. A non-OK status becomes a ServerError response whose message is
//          the status message, verbatim.
// Methods:
//   OK(): success.
//   Error(message, data?): failure carrying a message and optional structured data.
//   IsOk(): true for success.
//==========================================================================================================
class Status {
public:
    Status() = default;

    static Status OK() { return Status(); }
    static Status Error(std::string message, std::optional<JSONValue> data = std::nullopt) {
        Status s;
        s.failed = true;
        s.message = std::move(message);
        s.data = std::move(data);
        return s;
    }

    bool IsOk() const { return !failed; }
    explicit operator bool() const { return !failed; }
    const std::string& Message() const { return message; }
    const std::optional<JSONValue>& Data() const { return data; }

private:
    bool failed{false};
    std::string message;
    std::optional<JSONValue> data;
};

} // namespace jsonrpc
