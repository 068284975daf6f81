//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the Walter C++ client (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace walter {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
// Fields:
//   major, minor, patch: Version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

//==========================================================================================================
// getVersion
// Purpose: Returns the library semantic version components.
//==========================================================================================================
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string formatted as "MAJOR.MINOR.PATCH". Used as the default
//          client version in clientInfo and User-Agent.
//==========================================================================================================
std::string getVersionString();

} // namespace walter
