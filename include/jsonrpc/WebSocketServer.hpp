//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketServer.hpp
// Purpose: Coroutine-based WebSocket JSON-RPC server transport using Boost.Beast
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <string>

#include "jsonrpc/Transport.h"

namespace jsonrpc {

//==========================================================================================================
// WebSocketServer
// Purpose: Server transport. Every text message on any accepted connection is one frame; the frame's
//          response is queued on that connection and written in order.
// Notes:
//   - Binary messages are skipped with a warning.
//   - A connection that closes drops responses still addressed to it.
//==========================================================================================================
class WebSocketServer : public IServerTransport {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 9444); "0" picks a free port, see LocalPort()
    //   path: Upgrade path accepted; empty accepts any path
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"9444"};
        std::string path{"/rpc"};
    };

    explicit WebSocketServer(const Options& opts);
    ~WebSocketServer() override;

    //==========================================================================================================
    // Binds, listens and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that is ready once listening; carries errors::RpcError on bind failure.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes the acceptor and every connection, then joins the I/O thread.
    //==========================================================================================================
    std::future<void> Stop() override;

    std::optional<ServerFrame> Recv(std::stop_token stop) override;
    void SetErrorHandler(ErrorHandler handler) override;

    unsigned short LocalPort() const;

    // Number of open connections.
    std::size_t ConnectionCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// WebSocketServerFactory
// Purpose: Creates WebSocket server transports from "ws://<address>:<port>[/<path>]".
//==========================================================================================================
class WebSocketServerFactory : public IServerTransportFactory {
public:
    std::unique_ptr<IServerTransport> CreateServerTransport(const std::string& config) override;
};

} // namespace jsonrpc
