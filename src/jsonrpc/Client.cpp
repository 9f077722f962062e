//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: Client implementation - pending-call table, receive loop and the Join race
//==========================================================================================================

#include "jsonrpc/Client.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <fmt/format.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace jsonrpc {

namespace {

//==========================================================================================================
// PendingCall
// Purpose: Delivery slot for one in-flight call.
// Notes:
//   `resolved` is claimed with a compare-exchange by whichever outcome comes first (response, timeout,
//   cancellation, shutdown). Only the winner writes the slot; later outcomes are no-ops.
//==========================================================================================================
struct PendingCall {
    explicit PendingCall(uint64_t seq) : seq(seq) {}

    const uint64_t seq;
    std::atomic<bool> resolved{false};
    std::mutex mutex;
    std::condition_variable_any cv;
    bool done{false};
    std::optional<JSONRPCResponse> response;
    std::optional<errors::RpcError> failure;

    bool Claim() {
        bool expected = false;
        return resolved.compare_exchange_strong(expected, true);
    }

    bool Deliver(JSONRPCResponse&& resp) {
        if (!Claim()) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            response = std::move(resp);
            done = true;
        }
        cv.notify_all();
        return true;
    }

    bool Fail(errors::RpcError err) {
        if (!Claim()) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            failure = std::move(err);
            done = true;
        }
        cv.notify_all();
        return true;
    }
};

//==========================================================================================================
// DeadlineWatch
// Purpose: Requests stop on a call's stop source when its deadline passes. Disarmed on destruction.
//==========================================================================================================
class DeadlineWatch {
public:
    DeadlineWatch(boost::asio::io_context& io, std::chrono::steady_clock::time_point deadline,
                  std::shared_ptr<std::stop_source> stop)
        : timer(std::make_shared<boost::asio::steady_timer>(io, deadline)),
          fired(std::make_shared<std::atomic<bool>>(false)) {
        timer->async_wait([stop = std::move(stop), fired = fired](const boost::system::error_code& ec) {
            if (!ec) {
                fired->store(true);
                stop->request_stop();
            }
        });
    }

    ~DeadlineWatch() {
        auto t = timer;
        boost::asio::post(t->get_executor(), [t]() { t->cancel(); });
    }

    DeadlineWatch(const DeadlineWatch&) = delete;
    DeadlineWatch& operator=(const DeadlineWatch&) = delete;

    bool Fired() const { return fired->load(); }

private:
    std::shared_ptr<boost::asio::steady_timer> timer;
    std::shared_ptr<std::atomic<bool>> fired;
};

} // namespace

class Client::Impl {
public:
    std::unique_ptr<IClientTransport> transport;
    Options options;

    mutable std::mutex pendingMutex;
    std::unordered_map<uint64_t, std::shared_ptr<PendingCall>> pending;
    uint64_t nextSeq{1};
    bool closed{false};

    std::atomic<bool> running{false};
    std::atomic<bool> started{false};
    std::jthread recvThread;
    std::mutex shutdownMutex;
    bool shutDown{false};

    // Per-call deadline timers
    boost::asio::io_context timerIo;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> timerWork;
    std::thread timerThread;

    Impl(std::unique_ptr<IClientTransport> t, Options o) : transport(std::move(t)), options(o) {}

    //==========================================================================================================
    // Removes the entry for seq. Exactly one caller gets the entry; every other call returns nullptr.
    //==========================================================================================================
    std::shared_ptr<PendingCall> tryTake(uint64_t seq) {
        std::lock_guard<std::mutex> lock(pendingMutex);
        auto it = pending.find(seq);
        if (it == pending.end()) {
            return nullptr;
        }
        auto call = std::move(it->second);
        pending.erase(it);
        return call;
    }

    std::shared_ptr<PendingCall> registerCall() {
        std::lock_guard<std::mutex> lock(pendingMutex);
        if (closed || !running.load()) {
            throw errors::Closed("client is not running");
        }
        const uint64_t seq = nextSeq++;
        auto call = std::make_shared<PendingCall>(seq);
        pending.emplace(seq, call);
        return call;
    }

    void failAll(const std::string& reason) {
        std::unordered_map<uint64_t, std::shared_ptr<PendingCall>> drained;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            closed = true;
            drained.swap(pending);
        }
        if (!drained.empty()) {
            LOG_INFO("Client: failing {} pending call(s): {}", drained.size(), reason);
        }
        for (auto& [seq, call] : drained) {
            call->Fail(errors::Closed(reason));
        }
    }

    void receiveLoop(std::stop_token st) {
        LOG_DEBUG("Client: receive loop started");
        while (!st.stop_requested()) {
            std::optional<std::string> frame;
            try {
                frame = transport->Recv(st);
            } catch (const std::exception& e) {
                LOG_ERROR("Client: transport receive failed: {}", e.what());
                break;
            }
            if (!frame.has_value()) {
                LOG_INFO("Client: transport reached end of stream");
                break;
            }
            handleFrame(*frame);
        }
        running = false;
        failAll("client receive loop ended");
        LOG_DEBUG("Client: receive loop exited");
    }

    void handleFrame(const std::string& frame) {
        FUNC_SCOPE();
        JSONValue doc;
        try {
            doc = ParseJSON(frame);
        } catch (const std::exception& e) {
            LOG_WARN("Client: dropping malformed frame: {}", e.what());
            return;
        }
        if (doc.Find("method") != nullptr) {
            LOG_WARN("Client: dropping server-initiated message");
            return;
        }
        JSONRPCResponse response;
        if (!response.FromJSON(doc)) {
            LOG_WARN("Client: dropping frame that is not a response");
            return;
        }
        if (!std::holds_alternative<int64_t>(response.id) || std::get<int64_t>(response.id) <= 0) {
            LOG_WARN("Client: dropping response with unmatched id {}", IdToString(response.id));
            return;
        }
        const uint64_t seq = static_cast<uint64_t>(std::get<int64_t>(response.id));
        auto call = tryTake(seq);
        if (!call) {
            LOG_WARN("Client: dropping response with unmatched id {}", seq);
            return;
        }
        if (!call->Deliver(std::move(response))) {
            LOG_DEBUG("Client: late response for abandoned call {} dropped", seq);
        }
    }

    void start() {
        FUNC_SCOPE();
        if (started.exchange(true)) {
            throw errors::InvalidState("client already started");
        }
        transport->Start().get();
        timerWork.emplace(boost::asio::make_work_guard(timerIo));
        timerThread = std::thread([this]() { timerIo.run(); });
        running = true;
        recvThread = std::jthread([this](std::stop_token st) { receiveLoop(st); });
        LOG_INFO("Client: started on session {}", transport->GetSessionId());
    }

    void shutdown(const std::string& reason) {
        std::lock_guard<std::mutex> guard(shutdownMutex);
        if (shutDown) {
            return;
        }
        shutDown = true;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            closed = true;
        }
        running = false;
        if (recvThread.joinable()) {
            recvThread.request_stop();
        }
        if (started.load()) {
            try {
                transport->Close().get();
            } catch (const std::exception& e) {
                LOG_WARN("Client: transport close failed: {}", e.what());
            }
        }
        if (recvThread.joinable() && recvThread.get_id() != std::this_thread::get_id()) {
            recvThread.join();
        }
        failAll(reason);
        timerWork.reset();
        timerIo.stop();
        if (timerThread.joinable()) {
            timerThread.join();
        }
    }

    //==========================================================================================================
    // Sends the request and races response / timeout / cancellation / shutdown.
    // Notes:
    //   Send and the wait share one stop source, tripped by the caller's token or by the deadline timer, so a
    //   transport that blocks in Send (HTTP round trip) is bounded by callTimeout as well.
    //==========================================================================================================
    JSONValue join(const std::string& method, const JSONValue& params, std::stop_token cancel) {
        FUNC_SCOPE();
        if (cancel.stop_requested()) {
            throw errors::Cancelled(fmt::format("call '{}' cancelled", method));
        }
        auto call = registerCall();
        const uint64_t seq = call->seq;
        const auto deadline = std::chrono::steady_clock::now() + options.callTimeout;

        auto callStop = std::make_shared<std::stop_source>();
        std::stop_callback onCancel(cancel, [callStop]() { callStop->request_stop(); });
        DeadlineWatch watch(timerIo, deadline, callStop);

        auto abandoned = [&]() -> errors::RpcError {
            if (!cancel.stop_requested() && (watch.Fired() || std::chrono::steady_clock::now() >= deadline)) {
                return errors::Timeout(fmt::format("call '{}' timed out after {} ms", method, options.callTimeout.count()));
            }
            return errors::Cancelled(fmt::format("call '{}' cancelled", method));
        };

        JSONRPCRequest request(static_cast<int64_t>(seq), method, params);
        try {
            transport->Send(callStop->get_token(), request.Serialize());
        } catch (const errors::RpcError& e) {
            call->Claim();
            tryTake(seq);
            LOG_DEBUG("Client: send for '{}' (id={}) failed: {}", method, seq, e.what());
            if (e.Kind() == errors::ErrorKind::Cancelled) {
                throw abandoned();
            }
            if (e.Kind() == errors::ErrorKind::Transport) {
                throw;
            }
            throw errors::TransportFailure(e.what());
        } catch (const std::exception& e) {
            call->Claim();
            tryTake(seq);
            throw errors::TransportFailure(fmt::format("send failed: {}", e.what()));
        }

        std::unique_lock<std::mutex> lock(call->mutex);
        const bool finished = call->cv.wait_until(lock, callStop->get_token(), deadline, [&call]() { return call->done; });
        if (!finished) {
            lock.unlock();
            if (call->Claim()) {
                tryTake(seq);
                throw abandoned();
            }
            // Another outcome claimed the slot first and is completing it
            lock.lock();
            call->cv.wait(lock, [&call]() { return call->done; });
        }

        if (call->failure.has_value()) {
            throw *call->failure;
        }
        JSONRPCResponse& resp = *call->response;
        if (auto err = errors::errorFromResponse(resp)) {
            throw errors::Remote(*err);
        }
        return resp.result.value_or(JSONValue(nullptr));
    }
};

///////////////////////////////////////////// Reply /////////////////////////////////////////////

struct Reply::State {
    std::shared_ptr<Client::Impl> client;
    std::string method;
    JSONValue params;
    std::stop_source cancel;
    std::unique_ptr<std::stop_callback<std::function<void()>>> callerLink;
    std::atomic<bool> joined{false};
};

Reply::Reply(std::shared_ptr<State> state) : state(std::move(state)) {}
Reply::Reply(Reply&&) noexcept = default;
Reply& Reply::operator=(Reply&&) noexcept = default;
Reply::~Reply() = default;

JSONValue Reply::Join() {
    FUNC_SCOPE();
    if (!state) {
        throw errors::InvalidState("empty reply");
    }
    if (state->joined.exchange(true)) {
        throw errors::InvalidState(fmt::format("reply for '{}' already joined", state->method));
    }
    return state->client->join(state->method, state->params, state->cancel.get_token());
}

void Reply::Cancel() {
    if (state) {
        state->cancel.request_stop();
    }
}

const std::string& Reply::Method() const {
    static const std::string kEmpty;
    return state ? state->method : kEmpty;
}

///////////////////////////////////////////// Client /////////////////////////////////////////////

std::chrono::milliseconds Client::Options::DefaultCallTimeout() {
    return std::chrono::milliseconds(GetEnvIntOrDefault("JSONRPC_CALL_TIMEOUT_MS", 60000));
}

Client::Client(std::unique_ptr<IClientTransport> transport)
    : Client(std::move(transport), Options{}) {}

Client::Client(std::unique_ptr<IClientTransport> transport, Options options)
    : pImpl(std::make_shared<Impl>(std::move(transport), options)) {
    FUNC_SCOPE();
    if (!pImpl->transport) {
        throw errors::Config("client requires a transport");
    }
}

Client::~Client() {
    FUNC_SCOPE();
    pImpl->shutdown("client destroyed");
}

std::future<void> Client::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    try {
        pImpl->start();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

std::future<void> Client::Close() {
    FUNC_SCOPE();
    pImpl->shutdown("client closed");
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

bool Client::IsRunning() const {
    return pImpl->running.load();
}

std::size_t Client::PendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->pendingMutex);
    return pImpl->pending.size();
}

Reply Client::CallRaw(std::stop_token cancel, const std::string& method, JSONValue params) {
    FUNC_SCOPE();
    auto state = std::make_shared<Reply::State>();
    state->client = pImpl;
    state->method = method;
    state->params = std::move(params);
    if (cancel.stop_possible()) {
        std::stop_source source = state->cancel;
        state->callerLink = std::make_unique<std::stop_callback<std::function<void()>>>(
            cancel, std::function<void()>([source]() mutable { source.request_stop(); }));
    }
    return Reply(std::move(state));
}

void Client::NotifyRaw(const std::string& method, JSONValue params) {
    FUNC_SCOPE();
    if (!pImpl->running.load()) {
        throw errors::Closed("client is not running");
    }
    JSONRPCNotification notification(method, std::move(params));
    pImpl->transport->Send(std::stop_token{}, notification.Serialize());
}

} // namespace jsonrpc
