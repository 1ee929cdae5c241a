//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Library version helpers
//==========================================================================================================
#include "toolgw/version.h"

#include <format>

namespace toolgw {

VersionInfo getVersion() {
    return VersionInfo{TOOLGW_VERSION_MAJOR, TOOLGW_VERSION_MINOR, TOOLGW_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return std::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace toolgw
