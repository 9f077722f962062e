//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport contract - opaque frame channels for the client and server runtimes
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace jsonrpc {

//==========================================================================================================
// IClientTransport
// Purpose: Bidirectional frame channel used by the client runtime.
// Notes:
//   - Frames are complete JSON texts; the transport never inspects them.
//   - Recv() is driven by exactly one receive loop. Send() may be called concurrently.
//==========================================================================================================
class IClientTransport {
public:
    virtual ~IClientTransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport (connects, spawns I/O threads as needed).
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport can send; it carries an errors::RpcError on failure.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport. A receiver blocked in Recv() observes end of stream.
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    // Session identifier for diagnostics.
    virtual std::string GetSessionId() const = 0;

    ///////////////////////////////////////////// Frame I/O /////////////////////////////////////////////
    //==========================================================================================================
    // Sends one frame; may block on backpressure or a request/response round trip.
    // Args:
    //   stop:  cancellation; a stop request aborts the send.
    //   frame: bytes to send.
    // Returns:
    //   (none). Throws errors::RpcError of kind Transport (I/O failure, closed) or Cancelled.
    //==========================================================================================================
    virtual void Send(std::stop_token stop, const std::string& frame) = 0;

    //==========================================================================================================
    // Blocks until the next inbound frame.
    // Args:
    //   stop: stop request makes Recv return std::nullopt.
    // Returns:
    //   The frame, or std::nullopt at end of stream. End of stream is permanent.
    //==========================================================================================================
    virtual std::optional<std::string> Recv(std::stop_token stop) = 0;
};

//==========================================================================================================
// ResponseWriter
// Purpose: Per-frame response path. Called exactly once per frame by the server runtime; an empty string
//          means the frame produced no response (notification or dropped frame).
//==========================================================================================================
using ResponseWriter = std::function<void(const std::string& response)>;

//==========================================================================================================
// ServerFrame
// Purpose: One inbound frame plus the path its response must take.
//==========================================================================================================
struct ServerFrame {
    std::string payload;
    ResponseWriter respond;
};

//==========================================================================================================
// IServerTransport
// Purpose: Source of inbound frames for the server runtime.
//==========================================================================================================
class IServerTransport {
public:
    virtual ~IServerTransport() = default;

    //==========================================================================================================
    // Starts accepting (binds/listens/spawns the accept loop as needed).
    // Returns:
    //   Future that completes when frames can be received; carries an exception on bind failure.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops producing frames and closes the inbound source; Recv() then returns std::nullopt.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    //==========================================================================================================
    // Blocks until the next inbound frame.
    // Args:
    //   stop: stop request makes Recv return std::nullopt.
    // Returns:
    //   The frame, or std::nullopt once the transport has stopped.
    //==========================================================================================================
    virtual std::optional<ServerFrame> Recv(std::stop_token stop) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

// Concrete transports are declared in their respective headers:
//  - jsonrpc/InMemoryTransport.hpp
//  - jsonrpc/HTTPTransport.hpp / jsonrpc/HTTPServer.hpp
//  - jsonrpc/WebSocketTransport.hpp / jsonrpc/WebSocketServer.hpp

//==========================================================================================================
// Transport factory interfaces
// Purpose: Create transports from configuration strings.
//==========================================================================================================
class IClientTransportFactory {
public:
    virtual ~IClientTransportFactory() = default;
    virtual std::unique_ptr<IClientTransport> CreateTransport(const std::string& config) = 0;
};

class IServerTransportFactory {
public:
    virtual ~IServerTransportFactory() = default;
    virtual std::unique_ptr<IServerTransport> CreateServerTransport(const std::string& config) = 0;
};

} // namespace jsonrpc
