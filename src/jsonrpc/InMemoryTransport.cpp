//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <future>
#include <random>
#include <stop_token>
#include <string>

#include "logging/Logger.h"
#include "jsonrpc/FrameQueue.h"
#include "jsonrpc/InMemoryTransport.hpp"
#include "jsonrpc/errors/Errors.h"

namespace jsonrpc {

struct InMemoryTransport::Channel {
    std::string sessionId;
    FrameQueue<std::string> toServer;
    FrameQueue<std::string> toClient;
    std::atomic<bool> clientConnected{false};
    std::atomic<bool> serverRunning{false};

    Channel() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }
};

namespace {
std::future<void> readyFuture() {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}
} // namespace

std::pair<std::unique_ptr<InMemoryClientTransport>, std::unique_ptr<InMemoryServerTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto channel = std::make_shared<Channel>();
    auto client = std::make_unique<InMemoryClientTransport>(channel);
    auto server = std::make_unique<InMemoryServerTransport>(channel);
    return std::make_pair(std::move(client), std::move(server));
}

///////////////////////////////////////////// Client end /////////////////////////////////////////////

InMemoryClientTransport::InMemoryClientTransport(std::shared_ptr<InMemoryTransport::Channel> channel)
    : channel(std::move(channel)) {
    FUNC_SCOPE();
}

InMemoryClientTransport::~InMemoryClientTransport() {
    FUNC_SCOPE();
    channel->clientConnected = false;
    channel->toClient.Close();
}

std::future<void> InMemoryClientTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting InMemoryClientTransport ({})", channel->sessionId);
    channel->clientConnected = true;
    return readyFuture();
}

std::future<void> InMemoryClientTransport::Close() {
    FUNC_SCOPE();
    LOG_INFO("Closing InMemoryClientTransport ({})", channel->sessionId);
    channel->clientConnected = false;
    channel->toClient.Close();
    return readyFuture();
}

bool InMemoryClientTransport::IsConnected() const {
    return channel->clientConnected.load() && !channel->toServer.IsClosed();
}

std::string InMemoryClientTransport::GetSessionId() const { return channel->sessionId; }

void InMemoryClientTransport::Send(std::stop_token stop, const std::string& frame) {
    FUNC_SCOPE();
    if (stop.stop_requested()) {
        throw errors::Cancelled("send cancelled");
    }
    if (!channel->clientConnected.load()) {
        throw errors::TransportFailure("in-memory transport is not connected");
    }
    LOG_DEBUG("InMemory send: {}", frame);
    if (!channel->toServer.Push(frame)) {
        throw errors::TransportFailure("in-memory peer is closed");
    }
}

std::optional<std::string> InMemoryClientTransport::Recv(std::stop_token stop) {
    return channel->toClient.Pop(stop);
}

///////////////////////////////////////////// Server end /////////////////////////////////////////////

InMemoryServerTransport::InMemoryServerTransport(std::shared_ptr<InMemoryTransport::Channel> channel)
    : channel(std::move(channel)) {
    FUNC_SCOPE();
}

InMemoryServerTransport::~InMemoryServerTransport() {
    FUNC_SCOPE();
    channel->serverRunning = false;
    channel->toServer.Close();
    channel->toClient.Close();
}

std::future<void> InMemoryServerTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting InMemoryServerTransport ({})", channel->sessionId);
    channel->serverRunning = true;
    return readyFuture();
}

std::future<void> InMemoryServerTransport::Stop() {
    FUNC_SCOPE();
    LOG_INFO("Stopping InMemoryServerTransport ({})", channel->sessionId);
    channel->serverRunning = false;
    channel->toServer.Close();
    // The connection is gone: the client side reaches end of stream
    channel->toClient.Close();
    return readyFuture();
}

std::optional<ServerFrame> InMemoryServerTransport::Recv(std::stop_token stop) {
    auto payload = channel->toServer.Pop(stop);
    if (!payload.has_value()) {
        return std::nullopt;
    }
    ServerFrame frame;
    frame.payload = std::move(*payload);
    std::weak_ptr<InMemoryTransport::Channel> weak = channel;
    ErrorHandler onError = errorHandler;
    frame.respond = [weak, onError](const std::string& response) {
        if (response.empty()) {
            return;
        }
        auto ch = weak.lock();
        if (!ch || !ch->toClient.Push(response)) {
            LOG_WARN("InMemoryServerTransport: client gone; dropping response");
            if (onError) {
                onError("client gone; response dropped");
            }
        }
    };
    return frame;
}

void InMemoryServerTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    errorHandler = std::move(handler);
}

} // namespace jsonrpc
