//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version of the toolgw gateway
//==========================================================================================================
#pragma once

#include <string>

#define TOOLGW_VERSION_MAJOR 0
#define TOOLGW_VERSION_MINOR 1
#define TOOLGW_VERSION_PATCH 0

namespace toolgw {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Components of the library version.
VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"; also announced as clientInfo.version to remote servers.
std::string getVersionString();

} // namespace toolgw
