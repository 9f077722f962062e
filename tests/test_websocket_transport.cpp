//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_websocket_transport.cpp
// Purpose: GoogleTests for the WebSocket server/client transports
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include "jsonrpc/Client.h"
#include "jsonrpc/Dispatcher.h"
#include "jsonrpc/Server.h"
#include "jsonrpc/WebSocketServer.hpp"
#include "jsonrpc/WebSocketTransport.hpp"
#include "jsonrpc/errors/Errors.h"

using namespace jsonrpc;
using namespace std::chrono_literals;

namespace {

struct WsFixture {
    std::unique_ptr<Server> server;
    WebSocketServer* ws{nullptr};
    unsigned short port{0};

    WsFixture() {
        auto d = std::make_shared<Dispatcher>();
        d->Register("SayHello", [](const std::string& msg, int64_t times) {
            (void)times;
            return std::make_tuple(msg, Status::OK());
        });
        d->Register("ErrorCall", []() { return Status::Error("test error"); });
        d->Register("Log", [](const std::string&) { return Status::OK(); });

        WebSocketServer::Options opts;
        opts.address = "127.0.0.1";
        opts.port = "0";
        auto transport = std::make_unique<WebSocketServer>(opts);
        ws = transport.get();
        server = std::make_unique<Server>(std::move(transport), d);
        server->Start().get();
        port = ws->LocalPort();
    }

    ~WsFixture() { server->Stop().get(); }

    std::string Url() const { return "ws://127.0.0.1:" + std::to_string(port) + "/rpc"; }
};

} // namespace

TEST(WebSocketTransport, ClientServerRoundTrip) {
    WsFixture fx;
    ASSERT_NE(fx.port, 0);
    Client client(WebSocketTransport::FromUrl(fx.Url()));
    client.Start().get();

    std::string out;
    client.Call("SayHello", "Hello", static_cast<int64_t>(1)).Join(out);
    EXPECT_EQ(out, "Hello");

    try {
        client.Call("ErrorCall").Join();
        FAIL() << "expected remote error";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Code(), JSONRPCErrorCodes::ServerError);
        EXPECT_STREQ(e.what(), "test error");
    }

    EXPECT_NO_THROW(client.Notify("Log", "line"));
    EXPECT_EQ(fx.ws->ConnectionCount(), 1u);
    client.Close().get();
}

TEST(WebSocketTransport, ConcurrentCallsShareOneConnection) {
    WsFixture fx;
    Client client(WebSocketTransport::FromUrl(fx.Url()));
    client.Start().get();

    std::vector<std::future<std::string>> results;
    for (int i = 0; i < 8; ++i) {
        results.push_back(std::async(std::launch::async, [&client, i]() {
            std::string out;
            client.Call("SayHello", "ws-" + std::to_string(i), static_cast<int64_t>(1)).Join(out);
            return out;
        }));
    }
    for (int i = 0; i < 8; ++i) {
        ASSERT_EQ(results[i].wait_for(5s), std::future_status::ready);
        EXPECT_EQ(results[i].get(), "ws-" + std::to_string(i));
    }
    client.Close().get();
}

TEST(WebSocketTransport, ServerStopEndsClientStream) {
    auto fx = std::make_unique<WsFixture>();
    auto transport = WebSocketTransport::FromUrl(fx->Url());
    WebSocketTransport* raw = transport.get();
    Client client(std::move(transport));
    client.Start().get();
    EXPECT_TRUE(raw->IsConnected());

    fx.reset();
    const auto until = std::chrono::steady_clock::now() + 3s;
    while (client.IsRunning() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(client.IsRunning());
    client.Close().get();
}

TEST(WebSocketTransport, SendRacingCloseNeverHangs) {
    WsFixture fx;
    const std::string frame = R"({"jsonrpc":"2.0","method":"Log","params":["x"]})";
    for (int round = 0; round < 10; ++round) {
        auto transport = WebSocketTransport::FromUrl(fx.Url());
        transport->Start().get();

        std::atomic<bool> go{false};
        std::vector<std::future<void>> senders;
        for (int i = 0; i < 4; ++i) {
            senders.push_back(std::async(std::launch::async, [&transport, &go, &frame]() {
                while (!go.load()) {
                    std::this_thread::yield();
                }
                for (;;) {
                    try {
                        transport->Send(std::stop_token(), frame);
                    } catch (const errors::RpcError& e) {
                        EXPECT_EQ(e.Kind(), errors::ErrorKind::Transport);
                        return;
                    }
                }
            }));
        }
        go = true;
        std::this_thread::sleep_for(1ms);
        transport->Close().get();
        for (auto& f : senders) {
            ASSERT_EQ(f.wait_for(3s), std::future_status::ready);
            f.get();
        }
    }
}

TEST(WebSocketTransport, SendAfterCloseFailsFast) {
    WsFixture fx;
    auto transport = WebSocketTransport::FromUrl(fx.Url());
    transport->Start().get();
    transport->Close().get();
    try {
        transport->Send(std::stop_token(), R"({"jsonrpc":"2.0","method":"Log"})");
        FAIL() << "expected transport error";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Transport);
        EXPECT_STREQ(e.what(), "WebSocket transport is not connected");
    }
}

TEST(WebSocketTransport, WrongPathRejected) {
    WsFixture fx;
    WebSocketTransport transport(WebSocketTransport::ParseUrl("ws://127.0.0.1:" + std::to_string(fx.port) + "/other"));
    try {
        transport.Start().get();
        FAIL() << "expected transport error";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Transport);
    }
    EXPECT_FALSE(transport.IsConnected());
}

TEST(WebSocketTransport, ParseUrl) {
    auto o = WebSocketTransport::ParseUrl("ws://localhost:9444/rpc");
    EXPECT_EQ(o.host, "localhost");
    EXPECT_EQ(o.port, "9444");
    EXPECT_EQ(o.path, "/rpc");

    auto d = WebSocketTransport::ParseUrl("ws://example.com");
    EXPECT_EQ(d.port, "80");
    EXPECT_EQ(d.path, "/");

    EXPECT_THROW(WebSocketTransport::ParseUrl("http://localhost:9444/rpc"), errors::RpcError);
    EXPECT_THROW(WebSocketTransport::ParseUrl("ws://:9444/rpc"), errors::RpcError);
}

TEST(WebSocketServer, Factory) {
    WebSocketServerFactory factory;
    auto transport = factory.CreateServerTransport("ws://127.0.0.1:0/rpc");
    ASSERT_NE(transport, nullptr);
    transport->Start().get();
    auto* server = dynamic_cast<WebSocketServer*>(transport.get());
    ASSERT_NE(server, nullptr);
    EXPECT_NE(server->LocalPort(), 0);
    EXPECT_EQ(server->ConnectionCount(), 0u);
    transport->Stop().get();

    EXPECT_THROW(factory.CreateServerTransport("http://127.0.0.1:0/rpc"), errors::RpcError);
}
