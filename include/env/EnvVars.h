//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read JSONRPC_* environment overrides (strings, flags and integers).
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvFlag
// Purpose: Reads a boolean switch; "1", "true" and "TRUE" are on, anything else is off.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, defaultValue ? "1" : "0");
    return (v == "1" || v == "true" || v == "TRUE");
}

//==========================================================================================================
// GetEnvIntOrDefault
// Purpose: Reads a signed integer override such as a timeout in milliseconds.
// Args:
//   name: Environment variable name.
//   defaultValue: Returned when the variable is unset, empty or not a complete integer.
// Returns:
//   Parsed value or defaultValue.
//==========================================================================================================
inline std::int64_t GetEnvIntOrDefault(const char* name, std::int64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    char* end = nullptr;
    const long long parsed = std::strtoll(v.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') {
        return defaultValue;
    }
    return static_cast<std::int64_t>(parsed);
}
