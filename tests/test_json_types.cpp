//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_types.cpp
// Purpose: JSON value model and JSON-RPC envelope serialization tests
//==========================================================================================================

#include <gtest/gtest.h>
#include "jsonrpc/JSONRPCTypes.h"
#include <limits>
#include <stdexcept>
#include <string>

using namespace jsonrpc;

TEST(JSONValue, ParsesScalarsAndContainers) {
    JSONValue v = ParseJSON(R"({"a":1,"b":1.5,"c":"x","d":true,"e":null,"f":[1,2]})");
    ASSERT_TRUE(v.IsObject());
    EXPECT_EQ(std::get<int64_t>(v.Find("a")->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(v.Find("b")->value), 1.5);
    EXPECT_EQ(std::get<std::string>(v.Find("c")->value), "x");
    EXPECT_TRUE(std::get<bool>(v.Find("d")->value));
    EXPECT_TRUE(v.Find("e")->IsNull());
    ASSERT_TRUE(v.Find("f")->IsArray());
    EXPECT_EQ(std::get<JSONValue::Array>(v.Find("f")->value).size(), 2u);
    EXPECT_EQ(v.Find("missing"), nullptr);
}

TEST(JSONValue, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = ParseJSON(R"("a\"b\\c\n\u00e9\ud83d\ude00")");
    EXPECT_EQ(std::get<std::string>(v.value), "a\"b\\c\n\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(JSONValue, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON("{"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1,]"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\":1} trailing"), std::runtime_error);
    EXPECT_THROW(ParseJSON("\"\\ud800\""), std::runtime_error);
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
}

TEST(JSONValue, SerializesCompactly) {
    JSONValue::Array arr;
    arr.push_back(std::make_shared<JSONValue>(static_cast<int64_t>(1)));
    arr.push_back(std::make_shared<JSONValue>(2.0));
    arr.push_back(std::make_shared<JSONValue>("tab\there"));
    arr.push_back(std::make_shared<JSONValue>(nullptr));
    EXPECT_EQ(SerializeJSON(JSONValue(arr)), "[1,2.0,\"tab\\there\",null]");
}

TEST(JSONValue, EqualityComparesNumbersByValue) {
    EXPECT_EQ(JSONValue(static_cast<int64_t>(3)), JSONValue(3.0));
    EXPECT_NE(JSONValue(static_cast<int64_t>(3)), JSONValue("3"));
    EXPECT_EQ(ParseJSON(R"({"x":[1,{"y":null}]})"), ParseJSON(R"({ "x" : [ 1, { "y" : null } ] })"));
    EXPECT_NE(ParseJSON(R"({"x":1})"), ParseJSON(R"({"x":1,"y":2})"));
}

TEST(JSONValue, KindNames) {
    EXPECT_EQ(KindOf(ParseJSON("7")), ValueKind::Integer);
    EXPECT_EQ(KindOf(ParseJSON("7.5")), ValueKind::Number);
    EXPECT_STREQ(ValueKindName(ValueKind::String), "string");
    EXPECT_STREQ(ValueKindName(ValueKind::Error), "error");
}

TEST(JSONRPCTypes, RequestSerializesPositionalParams) {
    JSONValue::Array params;
    params.push_back(std::make_shared<JSONValue>("Hello"));
    params.push_back(std::make_shared<JSONValue>(static_cast<int64_t>(1)));
    JSONRPCRequest req(static_cast<int64_t>(1), "SayHello", JSONValue(params));
    EXPECT_EQ(req.Serialize(), R"({"jsonrpc":"2.0","id":1,"method":"SayHello","params":["Hello",1]})");

    JSONRPCRequest back;
    ASSERT_TRUE(back.Deserialize(req.Serialize()));
    EXPECT_EQ(std::get<int64_t>(back.id), 1);
    EXPECT_EQ(back.method, "SayHello");
    ASSERT_TRUE(back.params.has_value());
    EXPECT_EQ(*back.params, JSONValue(params));
}

TEST(JSONRPCTypes, RequestRejectsBadEnvelopes) {
    JSONRPCRequest req;
    EXPECT_FALSE(req.Deserialize(R"({"jsonrpc":"1.0","id":1,"method":"x"})"));
    EXPECT_FALSE(req.Deserialize(R"({"jsonrpc":"2.0","id":1,"method":5})"));
    EXPECT_FALSE(req.Deserialize(R"({"jsonrpc":"2.0","id":[1],"method":"x"})"));
    EXPECT_FALSE(req.Deserialize("not json"));
    EXPECT_TRUE(req.Deserialize(R"({"jsonrpc":"2.0","id":"abc","method":"x"})"));
    EXPECT_EQ(std::get<std::string>(req.id), "abc");
    EXPECT_FALSE(req.params.has_value());
}

TEST(JSONRPCTypes, NotificationHasNoId) {
    JSONRPCNotification n("Log", ParseJSON(R"(["line"])"));
    EXPECT_EQ(n.Serialize(), R"({"jsonrpc":"2.0","method":"Log","params":["line"]})");

    JSONRPCNotification back;
    EXPECT_TRUE(back.Deserialize(n.Serialize()));
    EXPECT_EQ(back.method, "Log");
    EXPECT_FALSE(back.Deserialize(R"({"jsonrpc":"2.0","id":1,"method":"Log"})"));
}

TEST(JSONRPCTypes, ResponseCarriesResultOrError) {
    JSONRPCResponse ok(static_cast<int64_t>(7), JSONValue("hi"));
    EXPECT_EQ(ok.Serialize(), R"({"jsonrpc":"2.0","id":7,"result":"hi"})");

    JSONRPCResponse empty;
    empty.id = static_cast<int64_t>(8);
    EXPECT_EQ(empty.Serialize(), R"({"jsonrpc":"2.0","id":8,"result":null})");

    auto err = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "parse error");
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(err->Serialize()));
    EXPECT_TRUE(parsed.IsError());
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(parsed.id));

    JSONRPCResponse bad;
    EXPECT_FALSE(bad.Deserialize(R"({"jsonrpc":"2.0","id":1,"result":1,"error":{"code":1,"message":"m"}})"));
    EXPECT_FALSE(bad.Deserialize(R"({"jsonrpc":"2.0","id":1})"));
}

TEST(JSONRPCTypes, ErrorObjectRoundTripKeepsData) {
    JSONValue obj = CreateErrorObject(JSONRPCErrorCodes::InvalidParams, "bad", JSONValue("detail"));
    auto e = ParseErrorObject(obj);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->code, -32602);
    EXPECT_EQ(e->message, "bad");
    ASSERT_TRUE(e->data.has_value());
    EXPECT_EQ(std::get<std::string>(e->data->value), "detail");

    EXPECT_FALSE(ParseErrorObject(ParseJSON(R"({"code":"x","message":"m"})")).has_value());
    EXPECT_FALSE(ParseErrorObject(ParseJSON(R"({"message":"m"})")).has_value());
}

TEST(JSONRPCTypes, ErrorObjectCodeMustFitInt) {
    EXPECT_FALSE(ParseErrorObject(ParseJSON(R"({"code":4294934528,"message":"m"})")).has_value());
    EXPECT_FALSE(ParseErrorObject(ParseJSON(R"({"code":-9223372036854775807,"message":"m"})")).has_value());
    auto edge = ParseErrorObject(ParseJSON(R"({"code":-2147483648,"message":"m"})"));
    ASSERT_TRUE(edge.has_value());
    EXPECT_EQ(edge->code, std::numeric_limits<int>::min());
}

TEST(JSONRPCTypes, BatchWireShape) {
    BatchResponses batch;
    batch.emplace_back(static_cast<int64_t>(1), JSONValue(true));
    batch.emplace_back(static_cast<int64_t>(2), CreateErrorObject(JSONRPCErrorCodes::InternalError, "boom"), true);
    const std::string wire = SerializeBatch(batch);
    EXPECT_EQ(wire.front(), '[');

    BatchResponses back;
    ASSERT_TRUE(DeserializeBatch(wire, back));
    ASSERT_EQ(back.size(), 2u);
    EXPECT_FALSE(back[0].IsError());
    EXPECT_TRUE(back[1].IsError());
    EXPECT_FALSE(DeserializeBatch(R"({"jsonrpc":"2.0","id":1,"result":1})", back));
}

TEST(JSONRPCTypes, IdToStringQuotesStrings) {
    EXPECT_EQ(IdToString(JSONRPCId(static_cast<int64_t>(4))), "4");
    EXPECT_EQ(IdToString(JSONRPCId(std::string("a"))), "\"a\"");
    EXPECT_EQ(IdToString(JSONRPCId(nullptr)), "null");
}
