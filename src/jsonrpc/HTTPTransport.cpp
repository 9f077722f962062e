//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/jsonrpc/HTTPTransport.cpp
// Purpose: HTTP/HTTPS JSON-RPC client transport using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <random>
#include <set>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <fmt/format.h>

#include "jsonrpc/FrameQueue.h"
#include "jsonrpc/HTTPTransport.hpp"
#include "jsonrpc/errors/Errors.h"
#include "logging/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace jsonrpc {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

struct PostResult {
    unsigned status{0};
    std::string body;
};

//==========================================================================================================
// SendState
// Purpose: Hand-off between the I/O coroutine and the thread blocked in Send().
//==========================================================================================================
struct SendState {
    std::mutex mutex;
    std::condition_variable_any cv;
    bool done{false};
    PostResult result;
    std::string error;
};

} // namespace

class HTTPTransport::Impl {
public:
    HTTPTransport::Options opts;
    std::string sessionId;
    std::atomic<bool> connected{false};
    std::atomic<bool> started{false};

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx; // present when https
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    bool caInitOk{true};

    FrameQueue<std::string> inbound;

    std::mutex sendMutex;
    std::set<std::shared_ptr<SendState>> sends;

    explicit Impl(const HTTPTransport::Options& o) : opts(o) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "http-" + std::to_string(dis(gen));
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::ERR_clear_error();
            const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
            if (userProvidedCA) {
                try {
                    if (!opts.caFile.empty()) {
                        sslCtx->load_verify_file(opts.caFile);
                    }
                    if (!opts.caPath.empty()) {
                        sslCtx->add_verify_path(opts.caPath);
                    }
                } catch (const std::exception& e) {
                    LOG_ERROR("HTTPS: failed to load user-provided CA file/path: {}", e.what());
                    caInitOk = false;
                }
            } else {
                try {
                    sslCtx->set_default_verify_paths();
                } catch (const std::exception& e) {
                    LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", e.what());
                }
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        } else if (opts.scheme != "http") {
            throw errors::Config("unsupported scheme: " + opts.scheme);
        }
    }

    // Completes every Send() still waiting on the I/O loop.
    void failSends(const std::string& reason) {
        std::set<std::shared_ptr<SendState>> waiting;
        {
            std::lock_guard<std::mutex> lock(sendMutex);
            waiting.swap(sends);
        }
        for (auto& state : waiting) {
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->done) {
                    continue;
                }
                state->error = reason;
                state->done = true;
            }
            state->cv.notify_all();
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    http::request<http::string_body> buildRequest(const std::string& body, const std::string& host) {
        http::request<http::string_body> req{http::verb::post, opts.rpcPath, 11};
        req.set(http::field::host, host);
        for (const auto& [name, value] : opts.headers) {
            req.set(name, value);
        }
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    // Coroutine: POST JSON and return status and body; throws on I/O failure
    net::awaitable<PostResult> coPostJson(const std::string body) {
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(opts.host, opts.port, net::use_awaitable);
        LOG_DEBUG("HTTPTransport: resolved {}:{} path={}", opts.host, opts.port, opts.rpcPath);

        PostResult out;
        if (opts.scheme == "https") {
            if (!caInitOk) {
                throw errors::Config("HTTPS: CA initialization failed (bad caFile/caPath)");
            }
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            const std::string sni = opts.serverName.empty() ? opts.host : opts.serverName;
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), sni.c_str())) {
                LOG_WARN("HTTPS: failed to set SNI hostname {}", sni);
            }
            ::SSL_set1_host(stream.native_handle(), sni.c_str());
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

            auto req = buildRequest(body, sni);
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::response<http::string_body> res;
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.shutdown(ec);
            out.status = res.result_int();
            out.body = std::move(res.body());
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);

            auto req = buildRequest(body, opts.host);
            stream.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::response<http::string_body> res;
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            out.status = res.result_int();
            out.body = std::move(res.body());
        }
        LOG_DEBUG("HTTPTransport: status {} bytes={}", out.status, out.body.size());
        co_return out;
    }
};

HTTPTransport::HTTPTransport(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {
    FUNC_SCOPE();
}

HTTPTransport::~HTTPTransport() {
    FUNC_SCOPE();
    Close().get();
}

HTTPTransport::Options HTTPTransport::ParseUrl(const std::string& url) {
    Options opts;
    std::size_t pos = 0;
    const std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        opts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    }
    if (opts.scheme != "http" && opts.scheme != "https") {
        throw errors::Config("unsupported URL scheme: " + url);
    }

    const std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        opts.rpcPath = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        opts.rpcPath = url.substr(slash);
    }

    const std::size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos) {
        opts.host = hostPort;
        opts.port = (opts.scheme == "https") ? "443" : "80";
    } else {
        opts.host = hostPort.substr(0, colon);
        opts.port = hostPort.substr(colon + 1);
    }
    if (opts.host.empty() || opts.port.empty()) {
        throw errors::Config("invalid URL: " + url);
    }
    return opts;
}

std::unique_ptr<HTTPTransport> HTTPTransport::FromUrl(const std::string& url) {
    return std::make_unique<HTTPTransport>(ParseUrl(url));
}

std::future<void> HTTPTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->started.exchange(true)) {
        ready.set_exception(std::make_exception_ptr(errors::InvalidState("HTTP transport already started")));
        return fut;
    }
    LOG_INFO("Starting HTTPTransport ({}) to {}://{}:{}{}", pImpl->sessionId, pImpl->opts.scheme,
             pImpl->opts.host, pImpl->opts.port, pImpl->opts.rpcPath);
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPTransport: I/O loop failed: {}", e.what());
        }
    });
    pImpl->connected.store(true);
    ready.set_value();
    return fut;
}

std::future<void> HTTPTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    if (pImpl->connected.exchange(false)) {
        LOG_INFO("Closing HTTPTransport ({})", pImpl->sessionId);
    }
    pImpl->inbound.Close();
    if (pImpl->workGuard) {
        pImpl->workGuard->reset();
        pImpl->workGuard.reset();
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable() && pImpl->ioThread.get_id() != std::this_thread::get_id()) {
        pImpl->ioThread.join();
    }
    pImpl->failSends("transport closed");
    done.set_value();
    return fut;
}

bool HTTPTransport::IsConnected() const {
    return pImpl->connected.load();
}

std::string HTTPTransport::GetSessionId() const {
    return pImpl->sessionId;
}

void HTTPTransport::Send(std::stop_token stop, const std::string& frame) {
    FUNC_SCOPE();
    if (stop.stop_requested()) {
        throw errors::Cancelled("send cancelled");
    }
    if (!pImpl->connected.load()) {
        throw errors::TransportFailure("HTTP transport is not connected");
    }

    auto state = std::make_shared<SendState>();
    {
        std::lock_guard<std::mutex> lock(pImpl->sendMutex);
        pImpl->sends.insert(state);
    }
    if (!pImpl->connected.load()) {
        pImpl->failSends("transport closed");
    }
    net::co_spawn(pImpl->ioc, pImpl->coPostJson(frame),
        [state](std::exception_ptr eptr, PostResult result) {
            std::string error;
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    error = e.what();
                }
            }
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->done) {
                    return;
                }
                state->result = std::move(result);
                state->error = std::move(error);
                state->done = true;
            }
            state->cv.notify_all();
        });

    std::unique_lock<std::mutex> lock(state->mutex);
    const bool finished = state->cv.wait(lock, stop, [&state]() { return state->done; });
    lock.unlock();
    {
        std::lock_guard<std::mutex> guard(pImpl->sendMutex);
        pImpl->sends.erase(state);
    }
    lock.lock();
    if (!finished) {
        throw errors::Cancelled("send cancelled");
    }
    if (!state->error.empty()) {
        LOG_WARN("HTTPTransport: POST failed: {}", state->error);
        throw errors::TransportFailure(fmt::format("HTTP POST failed: {}", state->error));
    }
    const unsigned status = state->result.status;
    if (status < 200 || status >= 300) {
        throw errors::TransportFailure(fmt::format("HTTP status {}", status));
    }
    if (!state->result.body.empty()) {
        if (!pImpl->inbound.Push(std::move(state->result.body))) {
            throw errors::TransportFailure("HTTP transport is closed");
        }
    }
}

std::optional<std::string> HTTPTransport::Recv(std::stop_token stop) {
    return pImpl->inbound.Pop(stop);
}

//==========================================================================================================
// HTTPTransportFactory::CreateTransport
// Purpose: Parse semicolon-delimited key=value config into Options and create transport.
//==========================================================================================================
std::unique_ptr<IClientTransport> HTTPTransportFactory::CreateTransport(const std::string& config) {
    FUNC_SCOPE();
    auto trim = [](std::string s) -> std::string {
        std::size_t b = 0, e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t')) {
            ++b;
        }
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
            --e;
        }
        return s.substr(b, e - b);
    };
    auto toUnsigned = [](const std::string& key, const std::string& val) -> unsigned int {
        try {
            return static_cast<unsigned int>(std::stoul(val));
        } catch (const std::exception&) {
            throw errors::Config(fmt::format("invalid value for {}: {}", key, val));
        }
    };

    const std::string trimmed = trim(config);
    if (trimmed.rfind("http://", 0) == 0 || trimmed.rfind("https://", 0) == 0) {
        return std::make_unique<HTTPTransport>(HTTPTransport::ParseUrl(trimmed));
    }

    HTTPTransport::Options opts;
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) {
            sep = config.size();
        }
        std::string kv = trim(config.substr(start, sep - start));
        start = sep + 1;
        if (kv.empty()) {
            continue;
        }
        std::size_t eq = kv.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("HTTPTransportFactory: ignoring malformed entry '{}'", kv);
            continue;
        }
        std::string key = trim(kv.substr(0, eq));
        std::string val = trim(kv.substr(eq + 1));
        if (key == "scheme") {
            opts.scheme = val;
        } else if (key == "host") {
            opts.host = val;
        } else if (key == "port") {
            opts.port = val;
        } else if (key == "rpcPath" || key == "path") {
            opts.rpcPath = val;
        } else if (key == "serverName") {
            opts.serverName = val;
        } else if (key == "caFile") {
            opts.caFile = val;
        } else if (key == "caPath") {
            opts.caPath = val;
        } else if (key == "connectTimeoutMs") {
            opts.connectTimeoutMs = toUnsigned(key, val);
        } else if (key == "readTimeoutMs") {
            opts.readTimeoutMs = toUnsigned(key, val);
        } else if (key.rfind("header.", 0) == 0 && key.size() > 7) {
            opts.headers.emplace_back(key.substr(7), val);
        } else {
            LOG_DEBUG("HTTPTransportFactory: ignoring unknown key '{}'", key);
        }
    }
    return std::make_unique<HTTPTransport>(opts);
}

} // namespace jsonrpc
