//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: JSON-RPC server example (HTTP or WebSocket)
//==========================================================================================================

#include <chrono>
#include <atomic>
#include <csignal>
#include <cstddef>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <tuple>

#include "env/EnvVars.h"
#include "jsonrpc/Dispatcher.h"
#include "jsonrpc/HTTPServer.hpp"
#include "jsonrpc/Server.h"
#include "jsonrpc/WebSocketServer.hpp"
#include "jsonrpc/version.h"
#include "logging/Logger.h"

using namespace jsonrpc;

namespace {

std::atomic<bool> gSignalled{false};

void onSignal(int) {
    gSignalled = true;
}

//==========================================================================================================
// Greeter
// Purpose: Demo receiver whose member functions are exported as RPC methods.
//==========================================================================================================
class Greeter {
public:
    std::tuple<std::string, Status> SayHello(const std::string& msg, int64_t code) {
        LOG_INFO("SayHello({}, {})", msg, code);
        return {msg, Status::OK()};
    }

    std::tuple<std::string, Status> OptionCall(const std::string& msg, std::optional<int64_t> count) {
        if (!count.has_value()) {
            return {msg, Status::OK()};
        }
        std::string out;
        for (int64_t i = 0; i < *count; ++i) {
            out += msg;
        }
        return {out, Status::OK()};
    }

    Status ErrorCall() {
        return Status::Error("test error");
    }
};

} // namespace

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--transport")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnv();
    LOG_INFO("jsonrpc server example {}", getVersionString());

    auto dispatcher = std::make_shared<Dispatcher>();
    auto greeter = std::make_shared<Greeter>();
    dispatcher->Register("SayHello", greeter, &Greeter::SayHello);
    dispatcher->Register("OptionCall", greeter, &Greeter::OptionCall);
    dispatcher->Register("ErrorCall", greeter, &Greeter::ErrorCall);
    dispatcher->Register("Sleep", [](const CallContext& ctx, int64_t ms) -> std::tuple<bool, Status> {
        const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
        while (std::chrono::steady_clock::now() < until) {
            if (ctx.Done()) {
                return {false, Status::Error("interrupted")};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return {true, Status::OK()};
    });
    dispatcher->Register("Log", [](const std::string& line) -> Status {
        LOG_INFO("client says: {}", line);
        return Status::OK();
    });

    const std::string transportKind = getArgValue(argc, argv, "--transport").value_or("http");
    std::unique_ptr<IServerTransport> transport;
    try {
        if (transportKind == "http") {
            HTTPServerFactory factory;
            transport = factory.CreateServerTransport(getArgValue(argc, argv, "--listen").value_or("http://127.0.0.1:9443/rpc"));
        } else if (transportKind == "ws") {
            WebSocketServerFactory factory;
            transport = factory.CreateServerTransport(getArgValue(argc, argv, "--listen").value_or("ws://127.0.0.1:9444/rpc"));
        } else {
            std::cerr << "unknown transport: " << transportKind << " (expected http or ws)" << std::endl;
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    Server server(std::move(transport), dispatcher);
    server.SetErrorHandler([](const std::string& err) { LOG_WARN("server error: {}", err); });
    try {
        server.Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("failed to start: {}", e.what());
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    while (!gSignalled.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    LOG_INFO("shutting down");
    server.Stop().get();
    return 0;
}
