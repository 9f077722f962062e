//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Server runtime implementation
//==========================================================================================================

#include "jsonrpc/Server.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <system_error>
#include <thread>
#include <variant>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include "env/EnvVars.h"
#include "jsonrpc/JSONRPCTypes.h"
#include "jsonrpc/errors/Errors.h"
#include "logging/Logger.h"

namespace jsonrpc {

namespace {

// InternalError response for a frame whose dispatch threw; nothing when the frame carries no usable id.
std::optional<std::string> internalErrorFor(const std::string& payload, const std::string& message) {
    JSONValue doc;
    try {
        doc = ParseJSON(payload);
    } catch (const std::exception& e) {
        LOG_DEBUG("Server: no id recoverable from failed frame: {}", e.what());
        return std::nullopt;
    }
    const JSONValue* idv = doc.IsObject() ? doc.Find("id") : nullptr;
    if (idv == nullptr) {
        return std::nullopt;
    }
    JSONRPCId id = nullptr;
    if (std::holds_alternative<int64_t>(idv->value)) {
        id = std::get<int64_t>(idv->value);
    } else if (std::holds_alternative<std::string>(idv->value)) {
        id = std::get<std::string>(idv->value);
    }
    return CreateErrorResponse(id, JSONRPCErrorCodes::InternalError, message)->Serialize();
}

} // namespace

class Server::Impl {
public:
    std::unique_ptr<IServerTransport> transport;
    std::shared_ptr<Dispatcher> dispatcher;
    Options options;

    std::stop_source root;
    std::jthread recvThread;
    std::atomic<bool> running{false};
    std::atomic<bool> started{false};
    std::mutex lifecycleMutex;
    bool stopped{false};

    // Deadline timers for per-call contexts
    boost::asio::io_context timerIo;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> timerWork;
    std::thread timerThread;

    mutable std::mutex inFlightMutex;
    std::condition_variable inFlightCv;
    std::size_t inFlight{0};

    std::mutex errorMutex;
    ErrorHandler errorHandler;

    Impl(std::unique_ptr<IServerTransport> t, std::shared_ptr<Dispatcher> d, Options o)
        : transport(std::move(t)), dispatcher(std::move(d)), options(o) {}

    void reportError(const std::string& error) {
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(errorMutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(error);
        }
    }

    void receiveLoop(std::stop_token st) {
        LOG_DEBUG("Server: receive loop started");
        while (!st.stop_requested()) {
            std::optional<ServerFrame> frame;
            try {
                frame = transport->Recv(st);
            } catch (const std::exception& e) {
                LOG_ERROR("Server: transport receive failed: {}", e.what());
                reportError(std::string("transport receive failed: ") + e.what());
                break;
            }
            if (!frame.has_value()) {
                if (!st.stop_requested()) {
                    LOG_WARN("Server: transport reached end of stream");
                    reportError("transport reached end of stream");
                }
                break;
            }
            spawnTask(std::move(*frame));
        }
        LOG_DEBUG("Server: receive loop exited");
    }

    void spawnTask(ServerFrame frame) {
        {
            std::lock_guard<std::mutex> lock(inFlightMutex);
            ++inFlight;
        }
        auto shared = std::make_shared<ServerFrame>(std::move(frame));
        try {
            std::thread([this, shared]() mutable {
                runTask(*shared);
                shared.reset();
                finishTask();
            }).detach();
        } catch (const std::system_error& e) {
            LOG_ERROR("Server: could not start task: {}", e.what());
            completeFrame(*shared, std::string());
            finishTask();
        }
    }

    void finishTask() {
        // Notify under the lock: stop() may destroy this object as soon as it observes zero
        std::lock_guard<std::mutex> lock(inFlightMutex);
        --inFlight;
        inFlightCv.notify_all();
    }

    void completeFrame(ServerFrame& frame, const std::string& response) {
        if (!frame.respond) {
            return;
        }
        try {
            frame.respond(response);
        } catch (const std::exception& e) {
            LOG_ERROR("Server: writing response failed: {}", e.what());
            reportError(std::string("writing response failed: ") + e.what());
        }
    }

    //==========================================================================================================
    // Runs one frame under a context that stops on server shutdown or when callTimeout elapses.
    //==========================================================================================================
    void runTask(ServerFrame& frame) {
        FUNC_SCOPE();
        auto callStop = std::make_shared<std::stop_source>();
        std::stop_callback onRootStop(root.get_token(), [callStop]() { callStop->request_stop(); });

        const auto deadline = CallContext::Clock::now() + options.callTimeout;
        auto timer = std::make_shared<boost::asio::steady_timer>(timerIo, deadline);
        timer->async_wait([callStop](const boost::system::error_code& ec) {
            if (!ec) {
                callStop->request_stop();
            }
        });

        CallContext ctx(callStop->get_token(), deadline);
        std::optional<std::string> response;
        try {
            response = dispatcher->Dispatch(frame.payload, ctx);
        } catch (const std::exception& e) {
            LOG_ERROR("Server: dispatch failed: {}", e.what());
            response = internalErrorFor(frame.payload, e.what());
        } catch (...) {
            LOG_ERROR("Server: dispatch failed with a non-standard exception");
            response = internalErrorFor(frame.payload, "internal error");
        }
        boost::asio::post(timerIo, [timer]() { timer->cancel(); });

        completeFrame(frame, response.value_or(std::string()));
    }

    void start() {
        FUNC_SCOPE();
        std::lock_guard<std::mutex> lock(lifecycleMutex);
        if (stopped) {
            throw errors::InvalidState("server was stopped and cannot be restarted");
        }
        if (started.exchange(true)) {
            throw errors::InvalidState("server already started");
        }
        transport->Start().get();
        timerWork.emplace(boost::asio::make_work_guard(timerIo));
        timerThread = std::thread([this]() { timerIo.run(); });
        running = true;
        recvThread = std::jthread([this](std::stop_token st) { receiveLoop(st); });
        LOG_INFO("Server: started with {} method(s)", dispatcher->MethodNames().size());
    }

    void stop() {
        FUNC_SCOPE();
        std::lock_guard<std::mutex> lock(lifecycleMutex);
        if (stopped) {
            return;
        }
        stopped = true;
        running = false;
        root.request_stop();
        if (recvThread.joinable()) {
            recvThread.request_stop();
            recvThread.join();
        }
        {
            std::unique_lock<std::mutex> guard(inFlightMutex);
            inFlightCv.wait(guard, [this]() { return inFlight == 0; });
        }
        if (started.load()) {
            try {
                transport->Stop().get();
            } catch (const std::exception& e) {
                LOG_WARN("Server: transport stop failed: {}", e.what());
            }
        }
        timerWork.reset();
        timerIo.stop();
        if (timerThread.joinable()) {
            timerThread.join();
        }
        LOG_INFO("Server: stopped");
    }
};

std::chrono::milliseconds Server::Options::DefaultCallTimeout() {
    return std::chrono::milliseconds(GetEnvIntOrDefault("JSONRPC_SERVER_TIMEOUT_MS", 60000));
}

Server::Server(std::unique_ptr<IServerTransport> transport, std::shared_ptr<Dispatcher> dispatcher)
    : Server(std::move(transport), std::move(dispatcher), Options{}) {}

Server::Server(std::unique_ptr<IServerTransport> transport, std::shared_ptr<Dispatcher> dispatcher, Options options)
    : pImpl(std::make_unique<Impl>(std::move(transport), std::move(dispatcher), options)) {
    FUNC_SCOPE();
    if (!pImpl->transport) {
        throw errors::Config("server requires a transport");
    }
    if (!pImpl->dispatcher) {
        throw errors::Config("server requires a dispatcher");
    }
}

Server::~Server() {
    FUNC_SCOPE();
    pImpl->stop();
}

std::future<void> Server::Start() {
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

std::future<void> Server::Stop() {
    FUNC_SCOPE();
    pImpl->stop();
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

bool Server::IsRunning() const {
    return pImpl->running.load();
}

std::size_t Server::InFlight() const {
    std::lock_guard<std::mutex> lock(pImpl->inFlightMutex);
    return pImpl->inFlight;
}

void Server::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->errorMutex);
        pImpl->errorHandler = handler;
    }
    pImpl->transport->SetErrorHandler(std::move(handler));
}

Dispatcher& Server::GetDispatcher() {
    return *pImpl->dispatcher;
}

} // namespace jsonrpc
