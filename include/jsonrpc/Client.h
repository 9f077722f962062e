//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: JSON-RPC client - call correlation, timeouts and cancellation over a client transport
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <stop_token>
#include <string>

#include "jsonrpc/JSONRPCTypes.h"
#include "jsonrpc/Transport.h"
#include "jsonrpc/errors/Errors.h"
#include "jsonrpc/typed/Convert.h"

namespace jsonrpc {

//==========================================================================================================
// Reply
// Purpose: Handle for one call. Nothing is sent until Join() runs.
// Methods:
//   Join():    sends the request and waits for the outcome; returns the raw result.
//   Join(out): same, converting the result into out.
//   Cancel():  aborts a pending or future Join() with a Cancelled error.
// Notes:
//   A Reply can be joined once. Join() throws errors::RpcError of kind Timeout, Cancelled, Closed,
//   Transport, Remote (the server's error object) or Decode.
//==========================================================================================================
class Reply {
public:
    Reply(Reply&&) noexcept;
    Reply& operator=(Reply&&) noexcept;
    ~Reply();

    JSONValue Join();

    template <typename T>
    void Join(T& out) {
        JSONValue v = Join();
        out = typed::FromJSON<T>(v);
    }

    void Cancel();

    const std::string& Method() const;

    struct State;

private:
    friend class Client;
    explicit Reply(std::shared_ptr<State> state);
    std::shared_ptr<State> state;
};

//==========================================================================================================
// Client
// Purpose: Issues calls and notifications over one transport and matches responses to calls by id.
// Notes:
//   - Ids are per-client sequence numbers starting at 1.
//   - One receive loop reads the transport. When it ends (end of stream or Close) the client is closed for
//     good; create a new client to reconnect.
//==========================================================================================================
class Client {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   callTimeout: per-call deadline measured from Join(); default 60s or JSONRPC_CALL_TIMEOUT_MS.
    //==========================================================================================================
    struct Options {
        std::chrono::milliseconds callTimeout{DefaultCallTimeout()};

        static std::chrono::milliseconds DefaultCallTimeout();
    };

    explicit Client(std::unique_ptr<IClientTransport> transport);
    Client(std::unique_ptr<IClientTransport> transport, Options options);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    ////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport and the receive loop.
    // Returns:
    //   Future that completes when calls can be issued; carries the transport's start error otherwise.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Closes the client: pending calls fail with Closed, the transport is closed and the loop joined.
    //==========================================================================================================
    std::future<void> Close();

    bool IsRunning() const;

    // Number of calls currently waiting for a response.
    std::size_t PendingCount() const;

    ////////////////////////////////////////// Calls ///////////////////////////////////////////
    //==========================================================================================================
    // Prepares a call; positional arguments are converted with typed::ToJSON.
    // Args:
    //   cancel: optional caller cancellation; a stop request aborts Join() promptly.
    //   method: RPC method name.
    //   args:   positional parameters.
    // Returns:
    //   Reply handle; the request is sent by Reply::Join().
    //==========================================================================================================
    template <typename... Args>
    Reply Call(const std::string& method, const Args&... args) {
        return CallRaw(std::stop_token{}, method, typed::MakeParams(args...));
    }

    template <typename... Args>
    Reply Call(std::stop_token cancel, const std::string& method, const Args&... args) {
        return CallRaw(std::move(cancel), method, typed::MakeParams(args...));
    }

    Reply CallRaw(std::stop_token cancel, const std::string& method, JSONValue params);

    //==========================================================================================================
    // Sends a notification; returns once the transport accepted the bytes. No response is awaited.
    // Throws errors::RpcError (Closed, Transport).
    //==========================================================================================================
    template <typename... Args>
    void Notify(const std::string& method, const Args&... args) {
        NotifyRaw(method, typed::MakeParams(args...));
    }

    void NotifyRaw(const std::string& method, JSONValue params);

    class Impl;

private:
    std::shared_ptr<Impl> pImpl;
};

} // namespace jsonrpc
