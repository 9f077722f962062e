//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: Method registry and request dispatch (parameter binding, invocation, result/error mapping)
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "jsonrpc/CallContext.h"
#include "jsonrpc/MethodDescriptor.h"
#include "jsonrpc/typed/Handler.h"

namespace jsonrpc {

//==========================================================================================================
// Dispatcher
// Purpose: Maps method names to handlers and turns one inbound frame into at most one outbound frame.
// Notes:
//   - Methods are registered up front as descriptors. The resolved call site for a name is built the first
//     time that name is dispatched and cached for the dispatcher's lifetime.
//   - Lookups run concurrently; call-site creation is serialized and happens once per name.
//==========================================================================================================
class Dispatcher {
public:
    Dispatcher();
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    ///////////////////////////////////////////// Registration /////////////////////////////////////////////
    //==========================================================================================================
    // Registers a hand-built descriptor.
    // Args:
    //   descriptor: name, param/output descriptors and invoker.
    // Returns:
    //   (none). Throws errors::RpcError (Registration) when the name is empty or already registered, the
    //   invoker is missing, an output other than the last is Error, the last output is not Error, or a
    //   required param follows an optional one.
    //==========================================================================================================
    void RegisterDescriptor(MethodDescriptor descriptor);

    //==========================================================================================================
    // Registers a typed callable.
    // Args:
    //   name: RPC method name.
    //   fn:   `[const CallContext&,] P...` -> Status | std::tuple<T..., Status>
    //==========================================================================================================
    template <typename Fn>
    void Register(const std::string& name, Fn fn) {
        RegisterDescriptor(typed::MakeDescriptor(name, std::move(fn)));
    }

    //==========================================================================================================
    // Registers a member function bound to a receiver.
    // Args:
    //   name:     RPC method name.
    //   receiver: object the method runs on.
    //   method:   pointer to member function with the same signature rules as above.
    //==========================================================================================================
    template <typename C, typename M>
    void Register(const std::string& name, std::shared_ptr<C> receiver, M method) {
        RegisterDescriptor(typed::MakeDescriptor(name, std::move(receiver), method));
    }

    bool HasMethod(const std::string& name) const;
    std::vector<std::string> MethodNames() const;

    // Number of call sites resolved so far (one per distinct dispatched method name).
    std::size_t CallSiteCount() const;

    /////////////////////////////////////////////// Dispatch ///////////////////////////////////////////////
    //==========================================================================================================
    // Dispatches one inbound frame.
    // Args:
    //   frame: raw JSON text of a request or notification.
    //   ctx:   per-dispatch cancellation/deadline context handed to handlers.
    // Returns:
    //   Serialized response for requests (including error responses); std::nullopt for notifications and for
    //   id-less frames that could not be handled.
    //==========================================================================================================
    std::optional<std::string> Dispatch(const std::string& frame,
                                        const CallContext& ctx = CallContext::Background());

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace jsonrpc
