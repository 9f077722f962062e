//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_transport.cpp
// Purpose: InMemoryTransport basic tests
//==========================================================================================================

#include <gtest/gtest.h>
#include "jsonrpc/Transport.h"
#include "jsonrpc/InMemoryTransport.hpp"
#include "jsonrpc/errors/Errors.h"
#include <chrono>
#include <future>
#include <stop_token>
#include <thread>

using namespace jsonrpc;

TEST(InMemoryTransport, FramesRouteBothWays) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);

    client->Start().get();
    server->Start().get();
    EXPECT_TRUE(client->IsConnected());
    EXPECT_EQ(client->GetSessionId().rfind("memory-", 0), 0u);

    client->Send(std::stop_token{}, "ping");
    auto frame = server->Recv(std::stop_token{});
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->payload, "ping");

    frame->respond("pong");
    auto back = client->Recv(std::stop_token{});
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, "pong");

    client->Close().get();
    server->Stop().get();
}

TEST(InMemoryTransport, EmptyResponseWritesNothing) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);
    client->Start().get();
    server->Start().get();

    client->Send(std::stop_token{}, "note");
    auto frame = server->Recv(std::stop_token{});
    ASSERT_TRUE(frame.has_value());
    frame->respond("");

    std::stop_source stop;
    auto fut = std::async(std::launch::async, [&client, &stop]() { return client->Recv(stop.get_token()); });
    EXPECT_EQ(fut.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);
    stop.request_stop();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_FALSE(fut.get().has_value());

    client->Close().get();
    server->Stop().get();
}

TEST(InMemoryTransport, ErrorWhenPeerDisconnected) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);

    client->Start().get();
    server->Start().get();

    // Disconnect server first
    server->Stop().get();

    try {
        client->Send(std::stop_token{}, "late");
        FAIL() << "expected transport error";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Transport);
    }
    EXPECT_FALSE(client->IsConnected());

    // The client stream ends with the server
    auto fut = std::async(std::launch::async, [&client]() { return client->Recv(std::stop_token{}); });
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_FALSE(fut.get().has_value());

    client->Close().get();
}

TEST(InMemoryTransport, SendBeforeStartFails) {
    auto pair = InMemoryTransport::CreatePair();
    EXPECT_THROW(pair.first->Send(std::stop_token{}, "x"), errors::RpcError);

    std::stop_source stop;
    stop.request_stop();
    pair.first->Start().get();
    try {
        pair.first->Send(stop.get_token(), "x");
        FAIL() << "expected cancellation";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Cancelled);
    }
}

TEST(InMemoryTransport, ServerRecvUnblocksOnStop) {
    auto pair = InMemoryTransport::CreatePair();
    auto server = std::move(pair.second);
    server->Start().get();

    auto fut = std::async(std::launch::async, [&server]() { return server->Recv(std::stop_token{}); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    server->Stop().get();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_FALSE(fut.get().has_value());
}
