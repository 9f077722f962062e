//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CallContext.h
// Purpose: Per-dispatch cancellation and deadline context handed to handlers
//==========================================================================================================

#pragma once

#include <chrono>
#include <stop_token>

namespace jsonrpc {

//==========================================================================================================
// CallContext
// Purpose: Carries the stop token and deadline for one dispatched frame.
// Notes:
//   - The server derives one context per frame from its root context; stopping the server or reaching the
//     deadline requests stop on StopToken().
//   - Cancellation is cooperative: handlers poll Done() or register a std::stop_callback.
//==========================================================================================================
class CallContext {
public:
    using Clock = std::chrono::steady_clock;

    CallContext() : deadline(Clock::time_point::max()) {}
    CallContext(std::stop_token stop, Clock::time_point deadline)
        : stop(std::move(stop)), deadline(deadline) {}

    // A context that is never cancelled and never expires.
    static CallContext Background() { return CallContext(); }

    std::stop_token StopToken() const { return stop; }
    Clock::time_point Deadline() const { return deadline; }

    bool Cancelled() const { return stop.stop_requested(); }
    bool Expired() const { return deadline != Clock::time_point::max() && Clock::now() >= deadline; }
    bool Done() const { return Cancelled() || Expired(); }

private:
    std::stop_token stop;
    Clock::time_point deadline;
};

} // namespace jsonrpc
