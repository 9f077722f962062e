//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: JSON-RPC server runtime - receive loop, one task per frame, per-call timeout contexts
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "jsonrpc/Dispatcher.h"
#include "jsonrpc/Transport.h"

namespace jsonrpc {

//==========================================================================================================
// Server
// Purpose: Owns a server transport and a dispatcher. A single receive loop pulls frames from the transport and
//          runs each one as its own task, so a slow handler never holds up intake.
// Notes:
//   - Every task gets a CallContext derived from the server's root context, bounded by Options::callTimeout.
//   - Stop() cancels the root context, waits for in-flight tasks and then stops the transport.
//==========================================================================================================
class Server {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   callTimeout: per-dispatch deadline; default 60s or JSONRPC_SERVER_TIMEOUT_MS.
    //==========================================================================================================
    struct Options {
        std::chrono::milliseconds callTimeout{DefaultCallTimeout()};

        static std::chrono::milliseconds DefaultCallTimeout();
    };

    Server(std::unique_ptr<IServerTransport> transport, std::shared_ptr<Dispatcher> dispatcher);
    Server(std::unique_ptr<IServerTransport> transport, std::shared_ptr<Dispatcher> dispatcher, Options options);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //==========================================================================================================
    // Starts the transport and the receive loop.
    // Returns:
    //   Future that completes once frames are being received; carries the transport's start error otherwise.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server. Safe to call more than once; a stopped server cannot be restarted.
    //==========================================================================================================
    std::future<void> Stop();

    bool IsRunning() const;

    // Number of frames currently being dispatched.
    std::size_t InFlight() const;

    // Receives loop-level errors (transport end of stream, failed response writes).
    using ErrorHandler = std::function<void(const std::string& error)>;
    void SetErrorHandler(ErrorHandler handler);

    Dispatcher& GetDispatcher();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace jsonrpc
