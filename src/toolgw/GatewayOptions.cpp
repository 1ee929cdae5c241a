//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayOptions.cpp
// Purpose: Option parsing
//==========================================================================================================

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <type_traits>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolgw/GatewayOptions.h"

namespace toolgw {

ProcessManagerOptions GatewayOptions::ProcessOptions() const {
    ProcessManagerOptions o;
    o.requestTimeout = requestTimeout;
    o.readyDelay = readyDelay;
    o.stopGrace = stopGrace;
    o.maxLineBytes = maxLineBytes;
    return o;
}

FilesystemAdapterOptions GatewayOptions::FilesystemOptions() const {
    FilesystemAdapterOptions o;
    o.requestTimeout = requestTimeout;
    o.readyDelay = fsReadyDelay;
    o.stopGrace = stopGrace;
    o.maxBufferBytes = maxLineBytes;
    return o;
}

GatewayOptions ParseGatewayOptions(const std::string& config) {
    GatewayOptions opts;
    auto trim = [](std::string s) -> std::string {
        std::size_t b = 0, e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t')) {
            ++b;
        }
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
            --e;
        }
        return s.substr(b, e - b);
    };
    auto parseCount = [](const std::string& key, const std::string& val, auto& target) -> bool {
        try {
            if (val.empty() || !std::isdigit(static_cast<unsigned char>(val.front()))) {
                throw std::invalid_argument(val);
            }
            std::size_t used = 0;
            unsigned long long v = std::stoull(val, &used);
            if (used != val.size()) {
                throw std::invalid_argument(val);
            }
            target = static_cast<std::remove_reference_t<decltype(target)>>(v);
            return true;
        } catch (const std::logic_error&) {
            LOG_WARN("ParseGatewayOptions: ignoring invalid {}='{}'", key, val);
            return false;
        }
    };
    auto parseMs = [&](const std::string& key, const std::string& val, std::chrono::milliseconds& target) {
        uint64_t ms = 0;
        if (parseCount(key, val, ms)) {
            target = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
        }
    };

    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) { sep = config.size(); }
        std::string kv = trim(config.substr(start, sep - start));
        std::size_t eq = kv.find('=');
        if (!kv.empty() && eq != std::string::npos) {
            std::string key = trim(kv.substr(0, eq));
            std::string val = trim(kv.substr(eq + 1));
            if (key == "request_timeout_ms") {
                parseMs(key, val, opts.requestTimeout);
            } else if (key == "ready_delay_ms") {
                parseMs(key, val, opts.readyDelay);
            } else if (key == "fs_ready_delay_ms") {
                parseMs(key, val, opts.fsReadyDelay);
            } else if (key == "stop_grace_ms") {
                parseMs(key, val, opts.stopGrace);
            } else if (key == "max_line_bytes") {
                parseCount(key, val, opts.maxLineBytes);
            } else if (key == "max_history_items") {
                parseCount(key, val, opts.maxHistoryItems);
            } else {
                LOG_WARN("ParseGatewayOptions: unknown key '{}'", key);
            }
        }
        start = sep + 1;
    }

    opts.requestTimeout = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(
        GetEnvUint64OrDefault("TOOLGW_REQUEST_TIMEOUT_MS", static_cast<uint64_t>(opts.requestTimeout.count()))));
    opts.readyDelay = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(
        GetEnvUint64OrDefault("TOOLGW_READY_DELAY_MS", static_cast<uint64_t>(opts.readyDelay.count()))));
    opts.fsReadyDelay = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(
        GetEnvUint64OrDefault("TOOLGW_FS_READY_DELAY_MS", static_cast<uint64_t>(opts.fsReadyDelay.count()))));
    return opts;
}

} // namespace toolgw
