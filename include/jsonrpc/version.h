//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version and wire protocol identifiers
//==========================================================================================================
#pragma once

#include <string>

namespace jsonrpc {

// Value of the "jsonrpc" member on every envelope this library writes.
inline constexpr const char* kProtocolVersion = "2.0";

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components of the library.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the library version.
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH"
//==========================================================================================================
std::string getVersionString();

} // namespace jsonrpc
