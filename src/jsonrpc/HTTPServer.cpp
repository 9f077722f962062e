//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/jsonrpc/HTTPServer.cpp
// Purpose: HTTP/HTTPS JSON-RPC server transport using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "jsonrpc/FrameQueue.h"
#include "jsonrpc/HTTPServer.hpp"
#include "jsonrpc/errors/Errors.h"
#include "logging/Logger.h"

#include <openssl/ssl.h>

namespace jsonrpc {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

//==========================================================================================================
// Exchange
// Purpose: One HTTP request waiting for the server runtime to answer its frame. The session coroutine waits
//          on `wake`; the response writer fills `body` and cancels the timer on the I/O thread.
//==========================================================================================================
struct Exchange {
    explicit Exchange(net::io_context& ioc) : wake(ioc, net::steady_timer::time_point::max()) {}

    std::mutex mutex;
    bool done{false};
    bool aborted{false};
    std::string body;
    net::steady_timer wake;
};

} // namespace

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::atomic<bool> running{false};
    std::atomic<unsigned short> localPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;

    FrameQueue<ServerFrame> frames;

    std::mutex exchangeMutex;
    std::set<std::shared_ptr<Exchange>> exchanges;

    std::mutex errorMutex;
    IServerTransport::ErrorHandler errorHandler;

    explicit Impl(const HTTPServer::Options& o) : opts(o) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw errors::Config(std::string("failed to load certificate/key: ") + e.what());
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        } else if (opts.scheme != "http") {
            throw errors::Config("unsupported scheme: " + opts.scheme);
        }
    }

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

    void forget(const std::shared_ptr<Exchange>& ex) {
        std::lock_guard<std::mutex> lock(exchangeMutex);
        exchanges.erase(ex);
    }

    //==========================================================================================================
    // Builds the frame for an exchange. The writer may run on any thread; it hands the body to the session
    // through the I/O context.
    //==========================================================================================================
    ServerFrame makeFrame(std::string payload, const std::shared_ptr<Exchange>& ex) {
        ServerFrame frame;
        frame.payload = std::move(payload);
        std::weak_ptr<Exchange> weak = ex;
        net::io_context* io = &ioc;
        frame.respond = [weak, io](const std::string& response) {
            auto target = weak.lock();
            if (!target) {
                LOG_DEBUG("HTTPServer: exchange gone; dropping response");
                return;
            }
            {
                std::lock_guard<std::mutex> lock(target->mutex);
                if (target->done) {
                    return;
                }
                target->body = response;
                target->done = true;
            }
            net::post(*io, [target]() { target->wake.cancel(); });
        };
        return frame;
    }

    http::response<http::string_body> makeStatus(http::status status, unsigned version, const std::string& text) {
        http::response<http::string_body> res{status, version};
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.body() = std::string("{\"error\":\"") + text + "\"}";
        res.prepare_payload();
        return res;
    }

    //==========================================================================================================
    // Validates the request, queues its frame and waits for the response writer.
    //==========================================================================================================
    net::awaitable<http::response<http::string_body>> exchange(http::request<http::string_body>& req) {
        if (req.method() != http::verb::post) {
            co_return makeStatus(http::status::bad_request, req.version(), "POST required");
        }
        const std::string target = std::string(req.target());
        if (target != opts.rpcPath) {
            co_return makeStatus(http::status::not_found, req.version(), "Not found");
        }
        if (!running.load()) {
            co_return makeStatus(http::status::service_unavailable, req.version(), "Server stopping");
        }

        auto ex = std::make_shared<Exchange>(ioc);
        {
            std::lock_guard<std::mutex> lock(exchangeMutex);
            exchanges.insert(ex);
        }
        if (!frames.Push(makeFrame(std::move(req.body()), ex))) {
            forget(ex);
            co_return makeStatus(http::status::service_unavailable, req.version(), "Server stopping");
        }

        for (;;) {
            {
                std::lock_guard<std::mutex> lock(ex->mutex);
                if (ex->done || ex->aborted) {
                    break;
                }
            }
            boost::system::error_code ec;
            co_await ex->wake.async_wait(net::redirect_error(net::use_awaitable, ec));
            ex->wake.expires_at(net::steady_timer::time_point::max());
        }
        forget(ex);

        std::lock_guard<std::mutex> lock(ex->mutex);
        if (!ex->done) {
            co_return makeStatus(http::status::service_unavailable, req.version(), "Server stopping");
        }
        if (ex->body.empty()) {
            http::response<http::string_body> res{http::status::no_content, req.version()};
            res.keep_alive(false);
            res.prepare_payload();
            co_return res;
        }
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.body() = std::move(ex->body);
        res.prepare_payload();
        co_return res;
    }

    void sessionError(const char* kind, const std::exception& e) {
        if (!running.load()) {
            LOG_DEBUG("HTTPServer {} session suppressed during shutdown: {}", kind, e.what());
        } else {
            setError(std::string("HTTPServer ") + kind + " session error: " + e.what());
        }
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(stream, buffer, req, net::use_awaitable);
            auto res = co_await exchange(req);
            co_await http::async_write(stream, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            sessionError("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(tls, buffer, req, net::use_awaitable);
            auto res = co_await exchange(req);
            co_await http::async_write(tls, res, net::use_awaitable);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            sessionError("TLS", e);
        }
        co_return;
    }

    //==========================================================================================================
    // Resolves and binds synchronously so bind errors reach the Start() future.
    //==========================================================================================================
    void bind() {
        if (opts.port.empty()) {
            throw errors::Config("HTTPServer invalid port: empty");
        }
        const bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
        if (!allDigits || opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw errors::Config("HTTPServer invalid port: " + opts.port);
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
            throw errors::TransportFailure(std::string("HTTPServer bind failed: ") + e.what());
        }
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }

    // Wakes every waiting session so it can answer 503.
    void abortExchanges() {
        std::set<std::shared_ptr<Exchange>> waiting;
        {
            std::lock_guard<std::mutex> lock(exchangeMutex);
            waiting.swap(exchanges);
        }
        for (auto& ex : waiting) {
            {
                std::lock_guard<std::mutex> lock(ex->mutex);
                ex->aborted = true;
            }
            net::post(ioc, [ex]() { ex->wake.cancel(); });
        }
    }
};

HTTPServer::HTTPServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {
    FUNC_SCOPE();
}

HTTPServer::~HTTPServer() {
    FUNC_SCOPE();
    Stop().get();
}

std::future<void> HTTPServer::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    try {
        pImpl->bind();
    } catch (...) {
        ready.set_exception(std::current_exception());
        return fut;
    }
    LOG_INFO("HTTPServer: listening on {}://{}:{}{}", pImpl->opts.scheme, pImpl->opts.address,
             pImpl->localPort.load(), pImpl->opts.rpcPath);
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer: I/O loop failed: {}", e.what());
            pImpl->setError(e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    const bool wasRunning = pImpl->running.exchange(false);
    pImpl->frames.Close();
    if (wasRunning) {
        LOG_INFO("HTTPServer: stopping");
    }
    // Frames queued but never received are answered with 503 by their sessions
    pImpl->abortExchanges();
    if (pImpl->acceptor) {
        net::post(pImpl->ioc, [impl = pImpl.get()]() {
            boost::system::error_code ec;
            impl->acceptor->close(ec);
        });
    }
    if (pImpl->ioThread.joinable()) {
        if (pImpl->ioThread.get_id() == std::this_thread::get_id()) {
            pImpl->ioc.stop();
        } else {
            // Let woken sessions write their 503 before the loop stops
            auto flushed = std::make_shared<std::promise<void>>();
            auto flushedFut = flushed->get_future();
            net::post(pImpl->ioc, [flushed]() { flushed->set_value(); });
            flushedFut.wait_for(std::chrono::milliseconds(500));
            pImpl->ioc.stop();
            pImpl->ioThread.join();
        }
    }
    done.set_value();
    return fut;
}

std::optional<ServerFrame> HTTPServer::Recv(std::stop_token stop) {
    return pImpl->frames.Pop(stop);
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->errorMutex);
    pImpl->errorHandler = std::move(handler);
}

unsigned short HTTPServer::LocalPort() const {
    return pImpl->localPort.load();
}

std::unique_ptr<IServerTransport> HTTPServerFactory::CreateServerTransport(const std::string& config) {
    FUNC_SCOPE();
    HTTPServer::Options opts;

    std::string cfg = config;
    auto trim = [](std::string& s) {
        auto notSpace = [](unsigned char c) { return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx) { return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
        std::string path = hostPortPath.substr(slash);
        if (path.size() > 1) {
            opts.rpcPath = path;
        }
    }
    trim(hostPort);

    // host[:port], IPv6 in [addr]:port form
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) {
            opts.port = "9443";
        }
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") {
                opts.certFile = val;
            } else if (key == "key") {
                opts.keyFile = val;
            }
        }
    }

    return std::make_unique<HTTPServer>(opts);
}

} // namespace jsonrpc
