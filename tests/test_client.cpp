//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client.cpp
// Purpose: Client correlation, timeout, cancellation and shutdown tests
//==========================================================================================================

#include <gtest/gtest.h>
#include "jsonrpc/Client.h"
#include "jsonrpc/Dispatcher.h"
#include "jsonrpc/FrameQueue.h"
#include "jsonrpc/InMemoryTransport.hpp"
#include "jsonrpc/Server.h"
#include "jsonrpc/errors/Errors.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

using namespace jsonrpc;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<Dispatcher> makeDispatcher() {
    auto d = std::make_shared<Dispatcher>();
    d->Register("SayHello", [](const std::string& msg, int64_t times) {
        (void)times;
        return std::make_tuple(msg, Status::OK());
    });
    d->Register("ErrorCall", []() { return Status::Error("test error"); });
    // Sleeps for ms or until the call context is done
    d->Register("Sleep", [](const CallContext& ctx, int64_t ms) {
        const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
        while (!ctx.Done() && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return std::make_tuple(ms, Status::OK());
    });
    return d;
}

struct Loopback {
    std::unique_ptr<Server> server;
    std::unique_ptr<Client> client;

    explicit Loopback(Client::Options copts = Client::Options{}) {
        auto pair = InMemoryTransport::CreatePair();
        Server::Options sopts;
        sopts.callTimeout = 5s;
        server = std::make_unique<Server>(std::move(pair.second), makeDispatcher(), sopts);
        server->Start().get();
        client = std::make_unique<Client>(std::move(pair.first), copts);
        client->Start().get();
    }

    ~Loopback() {
        client->Close().get();
        server->Stop().get();
    }
};

bool waitFor(const std::function<bool()>& pred, std::chrono::milliseconds limit = 2000ms) {
    const auto until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

//==========================================================================================================
// ScriptedTransport
// Purpose: Client transport whose inbound frames are pushed by the test; sent frames are recorded.
//==========================================================================================================
class ScriptedTransport : public IClientTransport {
public:
    struct Shared {
        FrameQueue<std::string> inbound;
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<std::string> sent;
        bool failSend{false};
        // When set, Send blocks like a slow round trip until its stop token fires
        bool blockSend{false};
        std::condition_variable_any blockCv;
        int interruptedSends{0};

        std::string WaitSent(std::size_t n) {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait_for(lock, 2s, [&]() { return sent.size() >= n; });
            return sent.size() >= n ? sent[n - 1] : std::string();
        }
    };

    explicit ScriptedTransport(std::shared_ptr<Shared> s) : shared(std::move(s)) {}

    std::future<void> Start() override {
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }
    std::future<void> Close() override {
        shared->inbound.Close();
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }
    bool IsConnected() const override { return !shared->inbound.IsClosed(); }
    std::string GetSessionId() const override { return "scripted"; }

    void Send(std::stop_token stop, const std::string& frame) override {
        std::unique_lock<std::mutex> lock(shared->mutex);
        if (shared->blockSend) {
            shared->blockCv.wait_for(lock, stop, 5s, []() { return false; });
            if (stop.stop_requested()) {
                ++shared->interruptedSends;
                throw errors::Cancelled("send cancelled");
            }
        }
        if (shared->failSend) {
            throw errors::TransportFailure("boom");
        }
        shared->sent.push_back(frame);
        shared->cv.notify_all();
    }
    std::optional<std::string> Recv(std::stop_token stop) override { return shared->inbound.Pop(stop); }

private:
    std::shared_ptr<Shared> shared;
};

int64_t idOf(const std::string& frame) {
    JSONRPCRequest req;
    if (!req.Deserialize(frame) || !std::holds_alternative<int64_t>(req.id)) {
        return -1;
    }
    return std::get<int64_t>(req.id);
}

} // namespace

TEST(Client, SayHelloRoundTrip) {
    Loopback lb;
    std::string out;
    lb.client->Call("SayHello", "Hello", static_cast<int64_t>(1)).Join(out);
    EXPECT_EQ(out, "Hello");
    EXPECT_EQ(lb.client->PendingCount(), 0u);
}

TEST(Client, RemoteErrorsKeepCodeAndMessage) {
    Loopback lb;
    try {
        lb.client->Call("ErrorCall").Join();
        FAIL() << "expected remote error";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Remote);
        EXPECT_EQ(e.Code(), JSONRPCErrorCodes::ServerError);
        EXPECT_STREQ(e.what(), "test error");
    }

    try {
        lb.client->Call("Nope").Join();
        FAIL() << "expected remote error";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Remote);
        EXPECT_EQ(e.Code(), JSONRPCErrorCodes::MethodNotFound);
    }

    try {
        lb.client->Call("SayHello", "only").Join();
        FAIL() << "expected remote error";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Code(), JSONRPCErrorCodes::InvalidParams);
        EXPECT_STREQ(e.what(), "missing value for required argument 1");
    }
}

TEST(Client, JoinDecodeFailureIsDecodeError) {
    Loopback lb;
    int64_t n = 0;
    try {
        lb.client->Call("SayHello", "text", static_cast<int64_t>(1)).Join(n);
        FAIL() << "expected decode error";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Decode);
    }
}

TEST(Client, CallerCancellationIsPrompt) {
    Loopback lb;
    std::stop_source cancel;
    auto reply = lb.client->Call(cancel.get_token(), "Sleep", static_cast<int64_t>(3000));
    auto fut = std::async(std::launch::async, [&reply]() { return reply.Join(); });
    ASSERT_TRUE(waitFor([&]() { return lb.client->PendingCount() == 1; }));

    const auto begin = std::chrono::steady_clock::now();
    cancel.request_stop();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(std::chrono::steady_clock::now() - begin < 1s);
    try {
        fut.get();
        FAIL() << "expected cancellation";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Cancelled);
        EXPECT_STREQ(e.what(), "call 'Sleep' cancelled");
    }
    EXPECT_EQ(lb.client->PendingCount(), 0u);
}

TEST(Client, ReplyCancelBeforeJoin) {
    Loopback lb;
    auto reply = lb.client->Call("SayHello", "x", static_cast<int64_t>(1));
    reply.Cancel();
    try {
        reply.Join();
        FAIL() << "expected cancellation";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Cancelled);
    }
}

TEST(Client, TimeoutThenLateResponseIsDropped) {
    Client::Options copts;
    copts.callTimeout = 100ms;
    Loopback lb(copts);

    try {
        lb.client->Call("Sleep", static_cast<int64_t>(300)).Join();
        FAIL() << "expected timeout";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Timeout);
        EXPECT_STREQ(e.what(), "call 'Sleep' timed out after 100 ms");
    }
    EXPECT_EQ(lb.client->PendingCount(), 0u);

    // The late response for the timed-out id is dropped; the next call gets its own
    std::this_thread::sleep_for(300ms);
    std::string out;
    lb.client->Call("SayHello", "after", static_cast<int64_t>(1)).Join(out);
    EXPECT_EQ(out, "after");
    EXPECT_TRUE(lb.client->IsRunning());
}

TEST(Client, JoinTwiceIsInvalidState) {
    Loopback lb;
    auto reply = lb.client->Call("SayHello", "x", static_cast<int64_t>(1));
    EXPECT_NO_THROW(reply.Join());
    try {
        reply.Join();
        FAIL() << "expected invalid state";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::InvalidState);
    }
}

TEST(Client, ConcurrentCallsAreCorrelated) {
    Loopback lb;
    constexpr int kCalls = 16;
    std::vector<std::future<std::string>> results;
    for (int i = 0; i < kCalls; ++i) {
        results.push_back(std::async(std::launch::async, [&lb, i]() {
            std::string out;
            lb.client->Call("SayHello", "msg-" + std::to_string(i), static_cast<int64_t>(1)).Join(out);
            return out;
        }));
    }
    for (int i = 0; i < kCalls; ++i) {
        ASSERT_EQ(results[i].wait_for(5s), std::future_status::ready);
        EXPECT_EQ(results[i].get(), "msg-" + std::to_string(i));
    }
    EXPECT_EQ(lb.client->PendingCount(), 0u);
}

TEST(Client, CloseFailsPendingCalls) {
    Loopback lb;
    auto reply = lb.client->Call("Sleep", static_cast<int64_t>(3000));
    auto fut = std::async(std::launch::async, [&reply]() { return reply.Join(); });
    ASSERT_TRUE(waitFor([&]() { return lb.client->PendingCount() == 1; }));

    lb.client->Close().get();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    try {
        fut.get();
        FAIL() << "expected closed";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Closed);
    }
    EXPECT_FALSE(lb.client->IsRunning());

    try {
        lb.client->Call("SayHello", "x", static_cast<int64_t>(1)).Join();
        FAIL() << "expected closed";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Closed);
        EXPECT_STREQ(e.what(), "client is not running");
    }
    EXPECT_THROW(lb.client->Notify("SayHello", "x", static_cast<int64_t>(1)), errors::RpcError);
}

TEST(Client, SequenceStartsAtOneAndStrayFramesAreIgnored) {
    auto shared = std::make_shared<ScriptedTransport::Shared>();
    Client client(std::make_unique<ScriptedTransport>(shared));
    client.Start().get();

    auto first = std::async(std::launch::async, [&client]() { return client.Call("A").Join(); });
    const std::string sent1 = shared->WaitSent(1);
    ASSERT_EQ(idOf(sent1), 1);

    // Noise the receive loop must survive
    shared->inbound.Push("garbage");
    shared->inbound.Push(R"({"jsonrpc":"2.0","method":"server/push"})");
    shared->inbound.Push(R"({"jsonrpc":"2.0","id":42,"result":"stray"})");
    shared->inbound.Push(R"({"jsonrpc":"2.0","id":"1","result":"wrong id type"})");
    shared->inbound.Push(R"({"jsonrpc":"2.0","id":1,"result":"ok"})");
    ASSERT_EQ(first.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(std::get<std::string>(first.get().value), "ok");

    auto second = std::async(std::launch::async, [&client]() { return client.Call("B").Join(); });
    ASSERT_EQ(idOf(shared->WaitSent(2)), 2);
    shared->inbound.Push(R"({"jsonrpc":"2.0","id":2,"error":{"code":-32001,"message":"custom","data":[1]}})");
    ASSERT_EQ(second.wait_for(2s), std::future_status::ready);
    try {
        second.get();
        FAIL() << "expected remote error";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Code(), -32001);
        ASSERT_TRUE(e.Data().has_value());
        EXPECT_EQ(*e.Data(), ParseJSON("[1]"));
    }

    // A duplicate response for an id that was already answered is dropped
    shared->inbound.Push(R"({"jsonrpc":"2.0","id":1,"result":"dup"})");
    EXPECT_TRUE(client.IsRunning());
    client.Close().get();
}

TEST(Client, NotificationHasNoId) {
    auto shared = std::make_shared<ScriptedTransport::Shared>();
    Client client(std::make_unique<ScriptedTransport>(shared));
    client.Start().get();
    client.Notify("Log", "line");
    const std::string frame = shared->WaitSent(1);
    JSONRPCNotification n;
    ASSERT_TRUE(n.Deserialize(frame)) << frame;
    EXPECT_EQ(n.method, "Log");
    EXPECT_EQ(client.PendingCount(), 0u);
    client.Close().get();
}

TEST(Client, SendFailureIsTransportErrorAndUnregisters) {
    auto shared = std::make_shared<ScriptedTransport::Shared>();
    shared->failSend = true;
    Client client(std::make_unique<ScriptedTransport>(shared));
    client.Start().get();
    try {
        client.Call("A").Join();
        FAIL() << "expected transport error";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Transport);
        EXPECT_STREQ(e.what(), "boom");
    }
    EXPECT_EQ(client.PendingCount(), 0u);
    client.Close().get();
}

TEST(Client, TimeoutBoundsBlockingSend) {
    auto shared = std::make_shared<ScriptedTransport::Shared>();
    shared->blockSend = true;
    Client::Options copts;
    copts.callTimeout = 100ms;
    Client client(std::make_unique<ScriptedTransport>(shared), copts);
    client.Start().get();

    const auto begin = std::chrono::steady_clock::now();
    try {
        client.Call("Slow").Join();
        FAIL() << "expected timeout";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Timeout);
        EXPECT_STREQ(e.what(), "call 'Slow' timed out after 100 ms");
    }
    EXPECT_TRUE(std::chrono::steady_clock::now() - begin < 2s);
    EXPECT_EQ(client.PendingCount(), 0u);
    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        EXPECT_EQ(shared->interruptedSends, 1);
        EXPECT_TRUE(shared->sent.empty());
    }
    client.Close().get();
}

TEST(Client, CallerCancelDuringBlockingSendIsCancelled) {
    auto shared = std::make_shared<ScriptedTransport::Shared>();
    shared->blockSend = true;
    Client client(std::make_unique<ScriptedTransport>(shared));
    client.Start().get();

    std::stop_source cancel;
    auto reply = client.Call(cancel.get_token(), "Slow");
    auto fut = std::async(std::launch::async, [&reply]() { reply.Join(); });
    ASSERT_TRUE(waitFor([&]() { return client.PendingCount() == 1; }));
    cancel.request_stop();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    try {
        fut.get();
        FAIL() << "expected cancellation";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Cancelled);
        EXPECT_STREQ(e.what(), "call 'Slow' cancelled");
    }
    EXPECT_EQ(client.PendingCount(), 0u);
    client.Close().get();
}

TEST(Client, EndOfStreamClosesClient) {
    auto shared = std::make_shared<ScriptedTransport::Shared>();
    Client client(std::make_unique<ScriptedTransport>(shared));
    client.Start().get();

    auto pending = std::async(std::launch::async, [&client]() { return client.Call("A").Join(); });
    shared->WaitSent(1);
    shared->inbound.Close();
    ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
    try {
        pending.get();
        FAIL() << "expected closed";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Closed);
    }
    EXPECT_TRUE(waitFor([&]() { return !client.IsRunning(); }));
    client.Close().get();
}

TEST(Client, StartTwiceIsInvalidState) {
    auto shared = std::make_shared<ScriptedTransport::Shared>();
    Client client(std::make_unique<ScriptedTransport>(shared));
    client.Start().get();
    auto again = client.Start();
    try {
        again.get();
        FAIL() << "expected invalid state";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::InvalidState);
    }
    client.Close().get();
}

TEST(Client, NullTransportRejected) {
    EXPECT_THROW({ Client c(std::unique_ptr<IClientTransport>{}); }, errors::RpcError);
}
