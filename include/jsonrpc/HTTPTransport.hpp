//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.hpp
// Purpose: Coroutine-based HTTP/HTTPS JSON-RPC client transport using Boost.Beast (TLS 1.3 only for HTTPS)
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
// HTTPTransport
// Purpose: Client transport over HTTP POST. Send() performs one request/response exchange and queues a
//          non-empty response body as the next inbound frame.
//==========================================================================================================
class HTTPTransport : public IClientTransport {
public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for HTTP/HTTPS endpoints and TLS verification.
    // Fields:
    //   scheme: "http" or "https" (default: http)
    //   host: Server hostname or IP (default: localhost)
    //   port: Service port (default: 9443)
    //   rpcPath: JSON-RPC path
    //   serverName: TLS SNI and hostname verification name (when https)
    //   caFile/caPath: Optional CA bundle/path for trust store
    //   connectTimeoutMs: Connect timeout in milliseconds
    //   readTimeoutMs: Read timeout in milliseconds; bounds one Send() round trip
    //   headers: Extra request headers, sent in order
    //==========================================================================================================
    struct Options {
        std::string scheme{"http"};
        std::string host{"localhost"};
        std::string port{"9443"};
        std::string rpcPath{"/rpc"};
        std::string serverName;
        std::string caFile;
        std::string caPath;
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};
        std::vector<std::pair<std::string, std::string>> headers;
    };

    explicit HTTPTransport(const Options& opts);
    ~HTTPTransport() override;

    //==========================================================================================================
    // Parses "http(s)://host[:port][/path]" into Options. Throws errors::RpcError (Config) on a bad URL.
    //==========================================================================================================
    static Options ParseUrl(const std::string& url);

    // Creates a transport for the URL with default timeouts.
    static std::unique_ptr<HTTPTransport> FromUrl(const std::string& url);

    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // POSTs the frame and waits for the HTTP response.
    // Args:
    //   stop:  a stop request abandons the wait (the exchange completes in the background and is dropped).
    //   frame: JSON-RPC text.
    // Returns:
    //   (none). Throws errors::RpcError: Transport on I/O failure or non-2xx status, Cancelled on stop.
    //==========================================================================================================
    void Send(std::stop_token stop, const std::string& frame) override;

    std::optional<std::string> Recv(std::stop_token stop) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// HTTPTransportFactory
// Purpose: Creates HTTP/HTTPS transports from "key=value;" configuration strings. Keys: scheme, host, port,
//          rpcPath, serverName, caFile, caPath, connectTimeoutMs, readTimeoutMs, header.<Name>.
//          A value that starts with http:// or https:// is parsed as a URL instead.
//==========================================================================================================
class HTTPTransportFactory : public IClientTransportFactory {
public:
    std::unique_ptr<IClientTransport> CreateTransport(const std::string& config) override;
};

} // namespace jsonrpc
