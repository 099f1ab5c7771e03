//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for toolhost (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace toolhost {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Returns the server semantic version components.
VersionInfo getVersion();

// Returns the semantic version formatted as "MAJOR.MINOR.PATCH".
std::string getVersionString();

} // namespace toolhost
