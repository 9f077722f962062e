//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logger with level filtering, optional log file and colorized labels.
//==========================================================================================================
#pragma once

#include <mutex>
#include <iostream>
#include <sstream>
#include <fstream>
#include <string>
#include <cstring>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <cstdlib>
#include <cctype>
#include <thread>
#include <fmt/format.h>
#include "env/EnvVars.h"

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

class Logger {
public:
    // Severity level scoped to Logger
    enum class Level {
        DEBUG = 0,
        INFO  = 1,
        WARN  = 2,
        ERROR = 3,
        FATAL = 4
    };

    // Convert common level strings to Logger::Level (case-insensitive). Defaults to DEBUG.
    static Level levelFromString(const std::string& lvl) {
        std::string s; s.reserve(lvl.size());
        for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
        if (s == "DEBUG") return Level::DEBUG;
        if (s == "INFO")  return Level::INFO;
        if (s == "WARN" || s == "WARNING")  return Level::WARN;
        if (s == "ERROR") return Level::ERROR;
        if (s == "FATAL") return Level::FATAL;
        return Level::DEBUG;
    }

    // Variadic logging with runtime format strings ({fmt} syntax)
    template <typename... Args>
    static void logf(const char* level, const char* format, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(format, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = fmt::format("Format error: {}", e.what());
        }
        log(level, buffer, file, line);
    }

public:
    // Configure logging
    static void setLogLevel(LogLevel level) {
        sLogLevel = level;
    }

    static void setLogLevelFromString(const std::string& lvl) {
        switch (levelFromString(lvl)) {
            case Level::DEBUG: sLogLevel = LogLevel::LOG_DEBUG_LEVEL; break;
            case Level::INFO:  sLogLevel = LogLevel::LOG_INFO_LEVEL;  break;
            case Level::WARN:  sLogLevel = LogLevel::LOG_WARN_LEVEL;  break;
            case Level::ERROR: sLogLevel = LogLevel::LOG_ERROR_LEVEL; break;
            case Level::FATAL: sLogLevel = LogLevel::LOG_FATAL_LEVEL; break;
        }
    }

    // Applies JSONRPC_LOG_LEVEL and JSONRPC_LOG_FILE when present.
    static void configureFromEnv() {
        const std::string lvl = GetEnvOrDefault("JSONRPC_LOG_LEVEL", "");
        if (!lvl.empty()) {
            setLogLevelFromString(lvl);
        }
        const std::string file = GetEnvOrDefault("JSONRPC_LOG_FILE", "");
        if (!file.empty()) {
            setLogFile(file);
        }
    }

    static void setLogFile(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        if (sLogFile.is_open()) {
            sLogFile.close();
        }
        sLogFile.open(filePath, std::ios::out | std::ios::app);
        if (!sLogFile.is_open()) {
            std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        } else {
            // Write a newline and timestamp as the first entry
            auto now = std::chrono::system_clock::now();
            std::time_t now_time = std::chrono::system_clock::to_time_t(now);
            std::tm buf{};
            ::localtime_r(&now_time, &buf);
            sLogFile << "\n=== Log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
            sLogFile.flush();
        }
    }

    //==========================================================================================================
    // Writes one line: "HH:MM:SS.mmm [LEVEL] <thread> file:line: msg".
    // Notes:
    //   The thread id tells apart output from receive loops and per-frame tasks. Only the base name of the
    //   source file is printed.
    //==========================================================================================================
    static void log(const char* level, const std::string& msg, const char* file, unsigned int line) {
        // Label color (JSONRPC_LOG_COLOR) and stream (JSONRPC_LOG_STDERR) are read once
        static const bool colorEnabled = GetEnvFlag("JSONRPC_LOG_COLOR", true);
        static const bool useStderr = GetEnvFlag("JSONRPC_LOG_STDERR", false);

        const auto now = std::chrono::system_clock::now();
        const std::time_t secs = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tmBuf{};
        ::localtime_r(&secs, &tmBuf);

        const char* base = std::strrchr(file, '/');
        base = base ? base + 1 : file;

        std::ostringstream oss;
        oss << std::put_time(&tmBuf, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << ' ';
        if (colorEnabled) {
            const bool severe = (::strncmp(level, "ERROR", 5) == 0) || (::strncmp(level, "FATAL", 5) == 0);
            oss << '[' << (severe ? "\033[38;5;88m" : "\033[35m") << level << "\033[0m] ";
        } else {
            oss << '[' << level << "] ";
        }
        oss << '<' << std::this_thread::get_id() << "> " << base << ':' << line << ": " << msg << '\n';
        const std::string logMessage = oss.str();

        std::lock_guard<std::mutex> lock(sLogMutex);
        std::ostream& out = useStderr ? std::cerr : std::cout;
        out << logMessage;
        out.flush();
        if (sLogFile.is_open()) {
            sLogFile << logMessage;
            sLogFile.flush();
        }
    }

    static LogLevel sLogLevel;

private:
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

// Static members are defined in Logger.cpp

// Logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit macros for logging
#ifdef _DEBUG
#define FUNC_ENTRY() LOG_DEBUG("ENTER: {}", __FUNCTION__)
#define FUNC_EXIT()  LOG_DEBUG("EXIT:  {}", __FUNCTION__)

// Scope-based entry/exit guard
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_ENTRY() ((void)0)
#define FUNC_EXIT()  ((void)0)
#define FUNC_SCOPE() ((void)0)
#endif
