//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_env_vars.cpp
// Purpose: Environment override helpers and logger level parsing
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdlib>
#include "env/EnvVars.h"
#include "logging/Logger.h"

TEST(EnvVars, StringDefaultAndOverride) {
    ::unsetenv("JSONRPC_TEST_STRING");
    EXPECT_EQ(GetEnvOrDefault("JSONRPC_TEST_STRING", "fallback"), "fallback");
    EXPECT_EQ(GetEnvOrDefault(nullptr, "fallback"), "fallback");
    EXPECT_EQ(GetEnvOrDefault("", "fallback"), "fallback");
    ::setenv("JSONRPC_TEST_STRING", "value", 1);
    EXPECT_EQ(GetEnvOrDefault("JSONRPC_TEST_STRING", "fallback"), "value");
    ::unsetenv("JSONRPC_TEST_STRING");
}

TEST(EnvVars, Flags) {
    ::unsetenv("JSONRPC_TEST_FLAG");
    EXPECT_TRUE(GetEnvFlag("JSONRPC_TEST_FLAG", true));
    EXPECT_FALSE(GetEnvFlag("JSONRPC_TEST_FLAG", false));
    ::setenv("JSONRPC_TEST_FLAG", "true", 1);
    EXPECT_TRUE(GetEnvFlag("JSONRPC_TEST_FLAG", false));
    ::setenv("JSONRPC_TEST_FLAG", "yes", 1);
    EXPECT_FALSE(GetEnvFlag("JSONRPC_TEST_FLAG", true));
    ::unsetenv("JSONRPC_TEST_FLAG");
}

TEST(EnvVars, Integers) {
    ::unsetenv("JSONRPC_TEST_INT");
    EXPECT_EQ(GetEnvIntOrDefault("JSONRPC_TEST_INT", 60000), 60000);
    ::setenv("JSONRPC_TEST_INT", "250", 1);
    EXPECT_EQ(GetEnvIntOrDefault("JSONRPC_TEST_INT", 60000), 250);
    ::setenv("JSONRPC_TEST_INT", "250ms", 1);
    EXPECT_EQ(GetEnvIntOrDefault("JSONRPC_TEST_INT", 60000), 60000);
    ::setenv("JSONRPC_TEST_INT", "", 1);
    EXPECT_EQ(GetEnvIntOrDefault("JSONRPC_TEST_INT", 60000), 60000);
    ::unsetenv("JSONRPC_TEST_INT");
}

TEST(Logger, LevelFromString) {
    EXPECT_EQ(Logger::levelFromString("info"), Logger::Level::INFO);
    EXPECT_EQ(Logger::levelFromString("Warning"), Logger::Level::WARN);
    EXPECT_EQ(Logger::levelFromString("ERROR"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::levelFromString("bogus"), Logger::Level::DEBUG);
}
