//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS JSON-RPC server transport using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <string>

#include "jsonrpc/Transport.h"

namespace jsonrpc {

//==========================================================================================================
// HTTPServer
// Purpose: Server transport. Each POST to rpcPath becomes one frame; the HTTP response is held open until the
//          server runtime writes the frame's response.
// Notes:
//   - 200 application/json carries the JSON-RPC response; 204 means the frame produced none.
//   - Non-POST => 400, unknown path => 404, server stopping => 503.
//==========================================================================================================
class HTTPServer : public IServerTransport {
public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, JSON-RPC path, and TLS files.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 9443); "0" picks a free port, see LocalPort()
    //   rpcPath: JSON-RPC path
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"9443"};
        std::string rpcPath{"/rpc"};
        std::string scheme{"http"}; // "http" or "https"
        std::string certFile; // PEM (required for https)
        std::string keyFile;  // PEM (required for https)
    };

    explicit HTTPServer(const Options& opts);
    ~HTTPServer() override;

    //==========================================================================================================
    // Binds, listens and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the acceptor is listening; carries errors::RpcError on bind failure.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the server: closes acceptor, answers waiting exchanges with 503, stops the I/O context and joins
    // the background thread. Recv() returns std::nullopt afterwards.
    //==========================================================================================================
    std::future<void> Stop() override;

    std::optional<ServerFrame> Recv(std::stop_token stop) override;

    void SetErrorHandler(ErrorHandler handler) override;

    // Port actually bound (useful with port "0"); 0 before Start().
    unsigned short LocalPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// HTTPServerFactory
// Purpose: Creates HTTP/HTTPS server transports from a URI configuration string:
//            - "http://<address>:<port>[/<rpcPath>]" (e.g., http://127.0.0.1:0/rpc)
//            - "https://<address>:<port>[/<rpcPath>]?cert=<pem>&key=<pem>"
//          Unknown parameters are ignored. If scheme is omitted, defaults to http.
//==========================================================================================================
class HTTPServerFactory : public IServerTransportFactory {
public:
    std::unique_ptr<IServerTransport> CreateServerTransport(const std::string& config) override;
};

} // namespace jsonrpc
