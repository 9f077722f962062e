//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/jsonrpc/WebSocketServer.cpp
// Purpose: WebSocket JSON-RPC server transport using Boost.Beast
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <deque>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "jsonrpc/FrameQueue.h"
#include "jsonrpc/WebSocketServer.hpp"
#include "jsonrpc/errors/Errors.h"
#include "logging/Logger.h"

namespace jsonrpc {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

//==========================================================================================================
// Connection
// Purpose: One accepted WebSocket. All members are touched on the I/O thread only.
//==========================================================================================================
struct Connection {
    explicit Connection(tcp::socket socket) : ws(std::move(socket)) {}

    websocket::stream<beast::tcp_stream> ws;
    std::deque<std::string> outbox;
    bool writing{false};
    bool open{true};
};

net::awaitable<void> writeLoop(std::shared_ptr<Connection> conn) {
    try {
        while (conn->open && !conn->outbox.empty()) {
            conn->ws.text(true);
            co_await conn->ws.async_write(net::buffer(conn->outbox.front()), net::use_awaitable);
            conn->outbox.pop_front();
        }
    } catch (const std::exception& e) {
        LOG_WARN("WebSocketServer: write failed; dropping {} queued response(s): {}", conn->outbox.size(), e.what());
        conn->open = false;
        conn->outbox.clear();
    }
    conn->writing = false;
    co_return;
}

// Runs on the I/O thread.
void enqueue(net::io_context& ioc, const std::shared_ptr<Connection>& conn, std::string text) {
    if (!conn->open) {
        LOG_DEBUG("WebSocketServer: connection closed; dropping response");
        return;
    }
    conn->outbox.push_back(std::move(text));
    if (!conn->writing) {
        conn->writing = true;
        net::co_spawn(ioc, writeLoop(conn), net::detached);
    }
}

} // namespace

class WebSocketServer::Impl {
public:
    WebSocketServer::Options opts;
    std::atomic<bool> running{false};
    std::atomic<unsigned short> localPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;

    FrameQueue<ServerFrame> frames;

    mutable std::mutex connMutex;
    std::set<std::shared_ptr<Connection>> connections;

    std::mutex errorMutex;
    IServerTransport::ErrorHandler errorHandler;

    explicit Impl(const WebSocketServer::Options& o) : opts(o) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        IServerTransport::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(errorMutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(msg);
        }
    }

    ServerFrame makeFrame(std::string payload, const std::shared_ptr<Connection>& conn) {
        ServerFrame frame;
        frame.payload = std::move(payload);
        std::weak_ptr<Connection> weak = conn;
        net::io_context* io = &ioc;
        frame.respond = [weak, io](const std::string& response) {
            if (response.empty()) {
                return;
            }
            net::post(*io, [weak, io, response]() {
                auto target = weak.lock();
                if (!target) {
                    LOG_DEBUG("WebSocketServer: connection gone; dropping response");
                    return;
                }
                enqueue(*io, target, response);
            });
        };
        return frame;
    }

    net::awaitable<void> session(tcp::socket socket) {
        auto conn = std::make_shared<Connection>(std::move(socket));
        bool registered = false;
        try {
            beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(conn->ws.next_layer(), buffer, req, net::use_awaitable);
            if (!websocket::is_upgrade(req) || (!opts.path.empty() && req.target() != opts.path)) {
                http::response<http::string_body> res{http::status::not_found, req.version()};
                res.keep_alive(false);
                res.body() = "{\"error\":\"Not found\"}";
                res.prepare_payload();
                co_await http::async_write(conn->ws.next_layer(), res, net::use_awaitable);
                co_return;
            }
            conn->ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            co_await conn->ws.async_accept(req, net::use_awaitable);
            {
                std::lock_guard<std::mutex> lock(connMutex);
                connections.insert(conn);
            }
            registered = true;
            LOG_DEBUG("WebSocketServer: connection accepted");

            for (;;) {
                beast::flat_buffer message;
                co_await conn->ws.async_read(message, net::use_awaitable);
                if (!conn->ws.got_text()) {
                    LOG_WARN("WebSocketServer: skipping binary message ({} bytes)", message.size());
                    continue;
                }
                if (!frames.Push(makeFrame(beast::buffers_to_string(message.data()), conn))) {
                    break;
                }
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed || !running.load()) {
                LOG_DEBUG("WebSocketServer: connection closed: {}", e.what());
            } else {
                setError(std::string("WebSocketServer session error: ") + e.what());
            }
        } catch (const std::exception& e) {
            setError(std::string("WebSocketServer session error: ") + e.what());
        }
        conn->open = false;
        if (registered) {
            std::lock_guard<std::mutex> lock(connMutex);
            connections.erase(conn);
        }
        co_return;
    }

    void bind() {
        const bool allDigits = !opts.port.empty() &&
            std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
        if (!allDigits || opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw errors::Config("WebSocketServer invalid port: " + opts.port);
        }
        try {
            tcp::resolver resolver(ioc);
            auto r = resolver.resolve(opts.address, opts.port);
            tcp::endpoint ep = *r.begin();
            acceptor = std::make_unique<tcp::acceptor>(ioc);
            acceptor->open(ep.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(ep);
            acceptor->listen();
            localPort = acceptor->local_endpoint().port();
        } catch (const boost::system::system_error& e) {
            throw errors::TransportFailure(std::string("WebSocketServer bind failed: ") + e.what());
        }
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                net::co_spawn(ioc, session(std::move(socket)), net::detached);
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("WebSocketServer accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("WebSocketServer accept error: ") + e.what());
            }
        }
        co_return;
    }

    // Sends a close frame on every connection, then signals `closed`.
    net::awaitable<void> closeAll(std::shared_ptr<std::promise<void>> closed) {
        boost::system::error_code ec;
        if (acceptor) {
            acceptor->close(ec);
        }
        std::set<std::shared_ptr<Connection>> open;
        {
            std::lock_guard<std::mutex> lock(connMutex);
            open = connections;
        }
        for (auto& conn : open) {
            if (conn->writing) {
                // A write is in flight; only one write may be pending, so drop the socket instead
                conn->open = false;
                beast::get_lowest_layer(conn->ws).close();
                continue;
            }
            conn->open = false;
            try {
                co_await conn->ws.async_close(websocket::close_code::going_away, net::use_awaitable);
            } catch (const std::exception& e) {
                LOG_DEBUG("WebSocketServer: close failed: {}", e.what());
            }
        }
        closed->set_value();
        co_return;
    }
};

WebSocketServer::WebSocketServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {
    FUNC_SCOPE();
}

WebSocketServer::~WebSocketServer() {
    FUNC_SCOPE();
    Stop().get();
}

std::future<void> WebSocketServer::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    try {
        pImpl->bind();
    } catch (...) {
        ready.set_exception(std::current_exception());
        return fut;
    }
    LOG_INFO("WebSocketServer: listening on ws://{}:{}{}", pImpl->opts.address, pImpl->localPort.load(), pImpl->opts.path);
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("WebSocketServer: I/O loop failed: {}", e.what());
            pImpl->setError(e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> WebSocketServer::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    const bool wasRunning = pImpl->running.exchange(false);
    pImpl->frames.Close();
    if (pImpl->ioThread.joinable()) {
        if (wasRunning) {
            LOG_INFO("WebSocketServer: stopping");
        }
        auto closed = std::make_shared<std::promise<void>>();
        auto closedFut = closed->get_future();
        net::co_spawn(pImpl->ioc, pImpl->closeAll(closed), net::detached);
        if (closedFut.wait_for(std::chrono::seconds(1)) != std::future_status::ready) {
            LOG_WARN("WebSocketServer: connections did not close in time");
        }
        pImpl->ioc.stop();
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

std::optional<ServerFrame> WebSocketServer::Recv(std::stop_token stop) {
    return pImpl->frames.Pop(stop);
}

void WebSocketServer::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->errorMutex);
    pImpl->errorHandler = std::move(handler);
}

unsigned short WebSocketServer::LocalPort() const {
    return pImpl->localPort.load();
}

std::size_t WebSocketServer::ConnectionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->connMutex);
    return pImpl->connections.size();
}

std::unique_ptr<IServerTransport> WebSocketServerFactory::CreateServerTransport(const std::string& config) {
    FUNC_SCOPE();
    WebSocketServer::Options opts;
    std::string cfg = config;
    if (cfg.rfind("ws://", 0) == 0) {
        cfg = cfg.substr(5);
    } else if (cfg.find("://") != std::string::npos) {
        throw errors::Config("unsupported WebSocket server URI: " + config);
    }
    std::string hostPort = cfg;
    const auto slash = cfg.find('/');
    if (slash != std::string::npos) {
        hostPort = cfg.substr(0, slash);
        opts.path = cfg.substr(slash);
    }
    const auto colon = hostPort.rfind(':');
    if (colon != std::string::npos) {
        opts.address = hostPort.substr(0, colon);
        opts.port = hostPort.substr(colon + 1);
    } else if (!hostPort.empty()) {
        opts.address = hostPort;
    }
    return std::make_unique<WebSocketServer>(opts);
}

} // namespace jsonrpc
