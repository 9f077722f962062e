//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketTransport.hpp
// Purpose: Coroutine-based WebSocket JSON-RPC client transport using Boost.Beast
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "jsonrpc/Transport.h"

namespace jsonrpc {

//==========================================================================================================
// WebSocketTransport
// Purpose: Client transport over one persistent WebSocket connection. A reader coroutine feeds inbound text
//          messages to Recv(); writes are serialized in Send() order.
//==========================================================================================================
class WebSocketTransport : public IClientTransport {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   host/port/path: endpoint (ws://host:port/path)
    //   connectTimeoutMs: TCP connect plus handshake timeout
    //   headers: extra handshake request headers
    //==========================================================================================================
    struct Options {
        std::string host{"localhost"};
        std::string port{"9444"};
        std::string path{"/rpc"};
        unsigned int connectTimeoutMs{10000};
        std::vector<std::pair<std::string, std::string>> headers;
    };

    explicit WebSocketTransport(const Options& opts);
    ~WebSocketTransport() override;

    // Parses "ws://host[:port][/path]". Throws errors::RpcError (Config) on a bad URL.
    static Options ParseUrl(const std::string& url);
    static std::unique_ptr<WebSocketTransport> FromUrl(const std::string& url);

    //==========================================================================================================
    // Connects and performs the WebSocket handshake.
    // Returns:
    //   Future ready once connected; carries errors::RpcError (Transport) on failure.
    //==========================================================================================================
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Queues one text message and waits until it is written. Throws errors::RpcError (Transport, Cancelled).
    //==========================================================================================================
    void Send(std::stop_token stop, const std::string& frame) override;
    std::optional<std::string> Recv(std::stop_token stop) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace jsonrpc
