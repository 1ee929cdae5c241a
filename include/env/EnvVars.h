//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read gateway configuration overrides from environment variables.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
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
// GetEnvUint64OrDefault
// Purpose: Reads an unsigned integer override (e.g. TOOLGW_REQUEST_TIMEOUT_MS). Malformed or empty values
//          fall back to the default.
// Args:
//   name: Environment variable name.
//   defaultValue: Value used when unset or unparsable.
// Returns:
//   Parsed value or defaultValue.
//==========================================================================================================
inline uint64_t GetEnvUint64OrDefault(const char* name, uint64_t defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return defaultValue;
    }
    try {
        std::size_t used = 0;
        unsigned long long v = std::stoull(raw, &used);
        if (used != raw.size()) {
            return defaultValue;
        }
        return static_cast<uint64_t>(v);
    } catch (const std::logic_error&) {
        return defaultValue;
    }
}
