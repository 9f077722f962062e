//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: JSON-RPC client example; calls the methods exported by jsonrpc_server
//==========================================================================================================

#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "jsonrpc/Client.h"
#include "jsonrpc/HTTPTransport.hpp"
#include "jsonrpc/WebSocketTransport.hpp"
#include "logging/Logger.h"

using namespace jsonrpc;

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

    const std::string url = getArgValue(argc, argv, "--url").value_or("http://127.0.0.1:9443/rpc");
    std::unique_ptr<IClientTransport> transport;
    try {
        if (url.rfind("ws://", 0) == 0) {
            transport = WebSocketTransport::FromUrl(url);
        } else {
            transport = HTTPTransport::FromUrl(url);
        }
    } catch (const errors::RpcError& e) {
        std::cerr << "invalid url: " << e.what() << std::endl;
        return 2;
    }

    Client client(std::move(transport));
    try {
        client.Start().get();

        std::string echo;
        client.Call("SayHello", std::string("Hello"), 1).Join(echo);
        std::cout << "SayHello -> " << echo << std::endl;

        std::string repeated;
        client.Call("OptionCall", "ab", 3).Join(repeated);
        std::cout << "OptionCall(ab, 3) -> " << repeated << std::endl;

        client.Call("OptionCall", "ab").Join(repeated);
        std::cout << "OptionCall(ab) -> " << repeated << std::endl;

        client.Notify("Log", "client example finished its calls");

        try {
            client.Call("ErrorCall").Join();
        } catch (const errors::RpcError& e) {
            std::cout << "ErrorCall -> code=" << e.Code() << " message=" << e.what() << std::endl;
        }
    } catch (const errors::RpcError& e) {
        LOG_ERROR("call failed ({}): {}", errors::errorKindName(e.Kind()), e.what());
        client.Close().get();
        return 1;
    }
    client.Close().get();
    return 0;
}
