//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for error kinds and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "jsonrpc/JSONRPCTypes.h"
#include "jsonrpc/errors/Errors.h"
#include <string>

using namespace jsonrpc;

TEST(Errors, ReservedCodes) {
    EXPECT_EQ(JSONRPCErrorCodes::ParseError, -32700);
    EXPECT_EQ(JSONRPCErrorCodes::InvalidRequest, -32600);
    EXPECT_EQ(JSONRPCErrorCodes::MethodNotFound, -32601);
    EXPECT_EQ(JSONRPCErrorCodes::InvalidParams, -32602);
    EXPECT_EQ(JSONRPCErrorCodes::InternalError, -32603);
    EXPECT_EQ(JSONRPCErrorCodes::ServerError, -32000);
}

TEST(Errors, CategoryMapping) {
    using jsonrpc::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ServerError), ErrorCategory::JsonRpcServer);
    EXPECT_EQ(errors::errorCategoryFromCode(-32099), ErrorCategory::JsonRpcServer);
    EXPECT_EQ(errors::errorCategoryFromCode(-32100), ErrorCategory::Unknown);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, KindConstructors) {
    EXPECT_EQ(errors::Timeout("t").Kind(), errors::ErrorKind::Timeout);
    EXPECT_EQ(errors::Cancelled("c").Kind(), errors::ErrorKind::Cancelled);
    EXPECT_EQ(errors::Closed("c").Kind(), errors::ErrorKind::Closed);
    EXPECT_EQ(errors::TransportFailure("t").Kind(), errors::ErrorKind::Transport);
    EXPECT_EQ(errors::Decode("d").Kind(), errors::ErrorKind::Decode);
    EXPECT_EQ(errors::Registration("r").Kind(), errors::ErrorKind::Registration);
    EXPECT_EQ(errors::InvalidState("i").Kind(), errors::ErrorKind::InvalidState);
    EXPECT_EQ(errors::Config("c").Kind(), errors::ErrorKind::Config);
    EXPECT_STREQ(errors::errorKindName(errors::ErrorKind::InvalidState), "invalid-state");

    auto remote = errors::Remote(JSONRPCErrorCodes::ServerError, "test error");
    EXPECT_EQ(remote.Kind(), errors::ErrorKind::Remote);
    EXPECT_EQ(remote.Code(), -32000);
    EXPECT_STREQ(remote.what(), "test error");
    EXPECT_FALSE(remote.Data().has_value());
}

TEST(Errors, ToWireErrorMapsNonRemoteToInternal) {
    auto e = errors::toWireError(errors::Decode("expected string, got integer"));
    EXPECT_EQ(e.code, JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(e.message, "expected string, got integer");
    EXPECT_FALSE(e.data.has_value());

    auto r = errors::toWireError(errors::Remote(-32001, "custom", JSONValue(static_cast<int64_t>(9))));
    EXPECT_EQ(r.code, -32001);
    EXPECT_EQ(r.message, "custom");
    ASSERT_TRUE(r.data.has_value());
    EXPECT_EQ(std::get<int64_t>(r.data->value), 9);
}

TEST(Errors, ErrorFromResponse) {
    JSONRPCResponse ok(static_cast<int64_t>(1), JSONValue(true));
    EXPECT_FALSE(errors::errorFromResponse(ok).has_value());

    auto bad = CreateErrorResponse(static_cast<int64_t>(2), JSONRPCErrorCodes::MethodNotFound, "method not found: Nope");
    auto e = errors::errorFromResponse(*bad);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->code, JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(e->message, "method not found: Nope");

    auto thrown = errors::Remote(*e);
    EXPECT_EQ(thrown.Code(), JSONRPCErrorCodes::MethodNotFound);

    JSONRPCResponse malformed;
    malformed.id = static_cast<int64_t>(3);
    malformed.error = ParseJSON(R"({"code":"oops"})");
    auto m = errors::errorFromResponse(malformed);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->code, JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(m->message, "malformed error object in response");
}
