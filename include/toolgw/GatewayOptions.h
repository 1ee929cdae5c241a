//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayOptions.h
// Purpose: Gateway-wide tunables and their key=value / environment parsing
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "toolgw/FilesystemServerAdapter.hpp"
#include "toolgw/StdioProcessManager.hpp"

namespace toolgw {

//==========================================================================================================
// GatewayOptions
// Fields:
//   requestTimeout: Deadline for every stdio operation (0 disables).
//   readyDelay: Upper bound on the generic stdio startup wait.
//   fsReadyDelay: Fixed grace period after spawning a filesystem server.
//   stopGrace: SIGTERM to SIGKILL interval.
//   maxLineBytes: Longest accepted stdio output line; also caps the filesystem accumulator.
//   maxHistoryItems: Per-session history cap.
//==========================================================================================================
struct GatewayOptions {
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds readyDelay{2000};
    std::chrono::milliseconds fsReadyDelay{2000};
    std::chrono::milliseconds stopGrace{2000};
    std::size_t maxLineBytes{1024 * 1024};
    std::size_t maxHistoryItems{50};

    ProcessManagerOptions ProcessOptions() const;
    FilesystemAdapterOptions FilesystemOptions() const;
};

//==========================================================================================================
// ParseGatewayOptions
// Purpose: Reads "request_timeout_ms=...;ready_delay_ms=...;fs_ready_delay_ms=...;stop_grace_ms=...;
//          max_line_bytes=...;max_history_items=..." and then applies the TOOLGW_REQUEST_TIMEOUT_MS,
//          TOOLGW_READY_DELAY_MS and TOOLGW_FS_READY_DELAY_MS environment overrides.
// Notes:
//   - Unknown keys and unparsable values are logged and skipped.
//==========================================================================================================
GatewayOptions ParseGatewayOptions(const std::string& config);

} // namespace toolgw
