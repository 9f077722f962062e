//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-process client/server transport pair for tests and embedding
//==========================================================================================================
#pragma once

#include "jsonrpc/Transport.h"
#include <memory>
#include <utility>

namespace jsonrpc {

class InMemoryClientTransport;
class InMemoryServerTransport;

//==========================================================================================================
// InMemoryTransport
// Purpose: Creates connected in-process transport pairs. Behaves like a persistent connection: all responses
//          share one channel back to the client and are matched purely by id.
//==========================================================================================================
class InMemoryTransport {
public:
    //==========================================================================================================
    // CreatePair
    // Purpose: Creates a client transport and the server transport it talks to.
    // Returns:
    //   pair(client, server). Stopping the server ends the client's inbound stream.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryClientTransport>, std::unique_ptr<InMemoryServerTransport>> CreatePair();

    struct Channel;
};

//==========================================================================================================
// InMemoryClientTransport
// Purpose: Client end of an in-memory pair.
//==========================================================================================================
class InMemoryClientTransport : public IClientTransport {
public:
    explicit InMemoryClientTransport(std::shared_ptr<InMemoryTransport::Channel> channel);
    ~InMemoryClientTransport() override;

    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Queues the frame for the server. Throws errors::RpcError (Transport) when either end is closed.
    //==========================================================================================================
    void Send(std::stop_token stop, const std::string& frame) override;
    std::optional<std::string> Recv(std::stop_token stop) override;

private:
    std::shared_ptr<InMemoryTransport::Channel> channel;
};

//==========================================================================================================
// InMemoryServerTransport
// Purpose: Server end of an in-memory pair. Each frame's response writer pushes onto the client's inbound
//          queue.
//==========================================================================================================
class InMemoryServerTransport : public IServerTransport {
public:
    explicit InMemoryServerTransport(std::shared_ptr<InMemoryTransport::Channel> channel);
    ~InMemoryServerTransport() override;

    std::future<void> Start() override;
    std::future<void> Stop() override;
    std::optional<ServerFrame> Recv(std::stop_token stop) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    std::shared_ptr<InMemoryTransport::Channel> channel;
    ErrorHandler errorHandler;
};

} // namespace jsonrpc
