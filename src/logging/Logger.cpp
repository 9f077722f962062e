//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

// Define static members; JSONRPC_LOG_LEVEL seeds the initial level.
LogLevel Logger::sLogLevel = [](){
    const std::string v = GetEnvOrDefault("JSONRPC_LOG_LEVEL", "INFO");
    switch (Logger::levelFromString(v)) {
        case Logger::Level::DEBUG: return LogLevel::LOG_DEBUG_LEVEL;
        case Logger::Level::INFO:  return LogLevel::LOG_INFO_LEVEL;
        case Logger::Level::WARN:  return LogLevel::LOG_WARN_LEVEL;
        case Logger::Level::ERROR: return LogLevel::LOG_ERROR_LEVEL;
        case Logger::Level::FATAL: return LogLevel::LOG_FATAL_LEVEL;
    }
    return LogLevel::LOG_INFO_LEVEL;
}();
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
