//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_convert.cpp
// Purpose: Typed conversion (Codec) tests
//==========================================================================================================

#include <gtest/gtest.h>
#include "jsonrpc/typed/Convert.h"
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

using namespace jsonrpc;

TEST(Convert, Scalars) {
    EXPECT_EQ(typed::FromJSON<int>(ParseJSON("42")), 42);
    EXPECT_EQ(typed::FromJSON<std::string>(ParseJSON("\"hi\"")), "hi");
    EXPECT_TRUE(typed::FromJSON<bool>(ParseJSON("true")));
    EXPECT_DOUBLE_EQ(typed::FromJSON<double>(ParseJSON("2")), 2.0);
    EXPECT_EQ(SerializeJSON(typed::ToJSON(std::string("x"))), "\"x\"");
    EXPECT_EQ(SerializeJSON(typed::ToJSON(7)), "7");
}

TEST(Convert, KindMismatchNamesBothKinds) {
    try {
        (void)typed::FromJSON<std::string>(ParseJSON("5"));
        FAIL() << "expected decode error";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Decode);
        EXPECT_STREQ(e.what(), "expected string, got integer");
    }
    EXPECT_THROW((void)typed::FromJSON<int64_t>(ParseJSON("1.5")), errors::RpcError);
}

TEST(Convert, IntegerRangeIsChecked) {
    EXPECT_THROW((void)typed::FromJSON<uint8_t>(ParseJSON("300")), errors::RpcError);
    EXPECT_THROW((void)typed::FromJSON<unsigned int>(ParseJSON("-1")), errors::RpcError);
    EXPECT_THROW((void)typed::FromJSON<int32_t>(ParseJSON("4294967296")), errors::RpcError);
    EXPECT_EQ(typed::FromJSON<int16_t>(ParseJSON("-32768")), -32768);
}

TEST(Convert, UnsignedBeyondInt64IsNotEncoded) {
    const uint64_t fits = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    EXPECT_EQ(SerializeJSON(typed::ToJSON(fits)), "9223372036854775807");
    EXPECT_EQ(typed::FromJSON<uint64_t>(typed::ToJSON(fits)), fits);
    try {
        (void)typed::ToJSON(std::numeric_limits<uint64_t>::max());
        FAIL() << "expected decode error";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.Kind(), errors::ErrorKind::Decode);
        EXPECT_STREQ(e.what(), "integer 18446744073709551615 out of range");
    }
    EXPECT_THROW((void)typed::MakeParams(fits + 1), errors::RpcError);
    EXPECT_EQ(SerializeJSON(typed::ToJSON(std::numeric_limits<uint32_t>::max())), "4294967295");
}

TEST(Convert, OptionalTreatsNullAsAbsent) {
    EXPECT_FALSE(typed::FromJSON<std::optional<int>>(ParseJSON("null")).has_value());
    EXPECT_EQ(typed::FromJSON<std::optional<int>>(ParseJSON("3")).value(), 3);
    EXPECT_TRUE(typed::ToJSON(std::optional<int>{}).IsNull());
    EXPECT_TRUE(typed::Codec<std::optional<int>>::optional);
    EXPECT_EQ(typed::Codec<std::optional<int>>::kind, ValueKind::Integer);
}

TEST(Convert, VectorReportsBadElement) {
    auto v = typed::FromJSON<std::vector<int>>(ParseJSON("[1,2,3]"));
    EXPECT_EQ(v, (std::vector<int>{1, 2, 3}));
    try {
        (void)typed::FromJSON<std::vector<int>>(ParseJSON("[1,\"x\"]"));
        FAIL() << "expected decode error";
    } catch (const errors::RpcError& e) {
        EXPECT_STREQ(e.what(), "element 1: expected integer, got string");
    }
}

TEST(Convert, MapAndTuple) {
    auto m = typed::FromJSON<std::map<std::string, int>>(ParseJSON(R"({"a":1,"b":2})"));
    EXPECT_EQ(m.at("b"), 2);

    auto t = typed::FromJSON<std::tuple<std::string, int64_t>>(ParseJSON(R"(["Hello",1])"));
    EXPECT_EQ(std::get<0>(t), "Hello");
    EXPECT_EQ(std::get<1>(t), 1);
    EXPECT_THROW((void)(typed::FromJSON<std::tuple<std::string, int64_t>>(ParseJSON(R"(["Hello"])"))), errors::RpcError);
}

TEST(Convert, MakeParamsBuildsPositionalArray) {
    JSONValue p = typed::MakeParams("Hello", static_cast<int64_t>(1), std::optional<int>{});
    EXPECT_EQ(SerializeJSON(p), "[\"Hello\",1,null]");
    EXPECT_EQ(SerializeJSON(typed::MakeParams()), "[]");
}
