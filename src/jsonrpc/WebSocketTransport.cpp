//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/jsonrpc/WebSocketTransport.cpp
// Purpose: WebSocket JSON-RPC client transport using Boost.Beast
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <random>
#include <set>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <fmt/format.h>

#include "jsonrpc/FrameQueue.h"
#include "jsonrpc/WebSocketTransport.hpp"
#include "jsonrpc/errors/Errors.h"
#include "logging/Logger.h"

namespace jsonrpc {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

//==========================================================================================================
// WriteOp
// Purpose: Completion slot for one queued message; Send() blocks on it.
//==========================================================================================================
struct WriteOp {
    std::mutex mutex;
    std::condition_variable_any cv;
    bool done{false};
    std::string error;

    void Complete(const std::string& err) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (done) {
                return;
            }
            error = err;
            done = true;
        }
        cv.notify_all();
    }
};

struct OutgoingMessage {
    std::string text;
    std::shared_ptr<WriteOp> op;
};

} // namespace

class WebSocketTransport::Impl {
public:
    WebSocketTransport::Options opts;
    std::string sessionId;
    std::atomic<bool> connected{false};
    std::atomic<bool> started{false};

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    websocket::stream<beast::tcp_stream> ws;

    // I/O thread only
    std::deque<OutgoingMessage> outbox;
    bool writing{false};

    std::mutex opsMutex;
    std::set<std::shared_ptr<WriteOp>> ops;

    FrameQueue<std::string> inbound;

    explicit Impl(const WebSocketTransport::Options& o) : opts(o), ws(ioc) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "ws-" + std::to_string(dis(gen));
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void failWrites(const std::string& reason) {
        std::set<std::shared_ptr<WriteOp>> waiting;
        {
            std::lock_guard<std::mutex> lock(opsMutex);
            waiting.swap(ops);
        }
        for (auto& op : waiting) {
            op->Complete(reason);
        }
    }

    net::awaitable<void> connect() {
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(opts.host, opts.port, net::use_awaitable);
        beast::get_lowest_layer(ws).expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
        co_await beast::get_lowest_layer(ws).async_connect(results, net::use_awaitable);
        beast::get_lowest_layer(ws).expires_never();

        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        auto headers = opts.headers;
        ws.set_option(websocket::stream_base::decorator([headers](websocket::request_type& req) {
            for (const auto& [name, value] : headers) {
                req.set(name, value);
            }
        }));
        co_await ws.async_handshake(opts.host + ":" + opts.port, opts.path, net::use_awaitable);
        co_return;
    }

    net::awaitable<void> readLoop() {
        try {
            for (;;) {
                beast::flat_buffer message;
                co_await ws.async_read(message, net::use_awaitable);
                if (!ws.got_text()) {
                    LOG_WARN("WebSocketTransport: skipping binary message ({} bytes)", message.size());
                    continue;
                }
                std::string text = beast::buffers_to_string(message.data());
                LOG_DEBUG("WebSocket recv: {}", text);
                if (!inbound.Push(std::move(text))) {
                    break;
                }
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed) {
                LOG_INFO("WebSocketTransport ({}): server closed the connection", sessionId);
            } else if (connected.load()) {
                LOG_WARN("WebSocketTransport ({}): read failed: {}", sessionId, e.what());
            }
        }
        connected = false;
        inbound.Close();
        failWrites("WebSocket connection closed");
        co_return;
    }

    net::awaitable<void> writeLoop() {
        while (!outbox.empty()) {
            OutgoingMessage& next = outbox.front();
            try {
                ws.text(true);
                co_await ws.async_write(net::buffer(next.text), net::use_awaitable);
                next.op->Complete(std::string());
            } catch (const std::exception& e) {
                LOG_WARN("WebSocketTransport: write failed: {}", e.what());
                for (auto& pending : outbox) {
                    pending.op->Complete(std::string("WebSocket write failed: ") + e.what());
                }
                outbox.clear();
                break;
            }
            outbox.pop_front();
        }
        writing = false;
        co_return;
    }

    // Runs on the I/O thread.
    void enqueue(OutgoingMessage message) {
        if (!connected.load()) {
            message.op->Complete("WebSocket transport is not connected");
            return;
        }
        outbox.push_back(std::move(message));
        if (!writing) {
            writing = true;
            net::co_spawn(ioc, writeLoop(), net::detached);
        }
    }

    net::awaitable<void> close(std::shared_ptr<std::promise<void>> closed) {
        try {
            if (ws.is_open() && !writing) {
                co_await ws.async_close(websocket::close_code::normal, net::use_awaitable);
            }
        } catch (const std::exception& e) {
            LOG_DEBUG("WebSocketTransport: close handshake failed: {}", e.what());
        }
        closed->set_value();
        co_return;
    }
};

WebSocketTransport::WebSocketTransport(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {
    FUNC_SCOPE();
}

WebSocketTransport::~WebSocketTransport() {
    FUNC_SCOPE();
    Close().get();
}

WebSocketTransport::Options WebSocketTransport::ParseUrl(const std::string& url) {
    Options opts;
    if (url.rfind("ws://", 0) != 0) {
        throw errors::Config("unsupported WebSocket URL: " + url);
    }
    const std::string rest = url.substr(5);
    const std::size_t slash = rest.find('/');
    const std::string hostPort = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    opts.path = (slash == std::string::npos) ? std::string("/") : rest.substr(slash);
    const std::size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos) {
        opts.host = hostPort;
        opts.port = "80";
    } else {
        opts.host = hostPort.substr(0, colon);
        opts.port = hostPort.substr(colon + 1);
    }
    if (opts.host.empty() || opts.port.empty()) {
        throw errors::Config("invalid WebSocket URL: " + url);
    }
    return opts;
}

std::unique_ptr<WebSocketTransport> WebSocketTransport::FromUrl(const std::string& url) {
    return std::make_unique<WebSocketTransport>(ParseUrl(url));
}

std::future<void> WebSocketTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->started.exchange(true)) {
        ready.set_exception(std::make_exception_ptr(errors::InvalidState("WebSocket transport already started")));
        return fut;
    }
    LOG_INFO("Starting WebSocketTransport ({}) to ws://{}:{}{}", pImpl->sessionId, pImpl->opts.host, pImpl->opts.port, pImpl->opts.path);
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("WebSocketTransport: I/O loop failed: {}", e.what());
        }
    });

    auto connected = net::co_spawn(pImpl->ioc, pImpl->connect(), net::use_future);
    try {
        connected.get();
    } catch (const std::exception& e) {
        LOG_ERROR("WebSocketTransport ({}): connect failed: {}", pImpl->sessionId, e.what());
        ready.set_exception(std::make_exception_ptr(
            errors::TransportFailure(fmt::format("WebSocket connect failed: {}", e.what()))));
        return fut;
    }
    pImpl->connected = true;
    net::co_spawn(pImpl->ioc, pImpl->readLoop(), net::detached);
    ready.set_value();
    return fut;
}

std::future<void> WebSocketTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    const bool wasConnected = pImpl->connected.exchange(false);
    if (pImpl->ioThread.joinable()) {
        if (wasConnected) {
            LOG_INFO("Closing WebSocketTransport ({})", pImpl->sessionId);
            auto closed = std::make_shared<std::promise<void>>();
            auto closedFut = closed->get_future();
            net::co_spawn(pImpl->ioc, pImpl->close(closed), net::detached);
            closedFut.wait_for(std::chrono::seconds(1));
        }
        pImpl->workGuard.reset();
        pImpl->ioc.stop();
        pImpl->ioThread.join();
    }
    pImpl->inbound.Close();
    pImpl->failWrites("transport closed");
    done.set_value();
    return fut;
}

bool WebSocketTransport::IsConnected() const {
    return pImpl->connected.load();
}

std::string WebSocketTransport::GetSessionId() const {
    return pImpl->sessionId;
}

void WebSocketTransport::Send(std::stop_token stop, const std::string& frame) {
    FUNC_SCOPE();
    if (stop.stop_requested()) {
        throw errors::Cancelled("send cancelled");
    }
    if (!pImpl->connected.load()) {
        throw errors::TransportFailure("WebSocket transport is not connected");
    }
    auto op = std::make_shared<WriteOp>();
    {
        std::lock_guard<std::mutex> lock(pImpl->opsMutex);
        pImpl->ops.insert(op);
    }
    // Close() may have drained ops and stopped the loop between the check above and the insert
    if (!pImpl->connected.load() || pImpl->ioc.stopped()) {
        op->Complete("WebSocket transport is not connected");
    }
    LOG_DEBUG("WebSocket send: {}", frame);
    net::post(pImpl->ioc, [impl = pImpl.get(), op, frame]() { impl->enqueue(OutgoingMessage{frame, op}); });

    std::unique_lock<std::mutex> lock(op->mutex);
    const bool finished = op->cv.wait(lock, stop, [&op]() { return op->done; });
    const std::string error = op->error;
    lock.unlock();
    {
        std::lock_guard<std::mutex> guard(pImpl->opsMutex);
        pImpl->ops.erase(op);
    }
    if (!finished) {
        throw errors::Cancelled("send cancelled");
    }
    if (!error.empty()) {
        throw errors::TransportFailure(error);
    }
}

std::optional<std::string> WebSocketTransport::Recv(std::stop_token stop) {
    return pImpl->inbound.Pop(stop);
}

} // namespace jsonrpc
