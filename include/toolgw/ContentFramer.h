//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for splitting a child-process byte stream into JSON message payloads
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace toolgw {

//========================================================================================================
// IContentFramer
// Purpose: Stateful decoder for one output stream. Instances are owned by exactly one process entry.
// Notes:
//   - tryDecodeEx inspects the buffer and reports how many leading bytes to drop.
//   - tryDecode drops skipped/oversized input itself and returns the next payload, if any.
//========================================================================================================
class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        Skipped,     // blank line or non-message text dropped
        TooLarge     // frame exceeded the configured maximum and was dropped
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // leading bytes to drop from the buffer
        std::string discarded;              // non-message text that was skipped (diagnostics)
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

// Strict newline-delimited framing: one payload per '\n', trailing '\r' stripped, blank lines skipped.
// Lines longer than maxLineBytes are discarded up to and including their terminating newline.
std::unique_ptr<IContentFramer> MakeLineFramer(std::size_t maxLineBytes = 1024 * 1024);

// Brace-boundary framing: extracts complete, string/escape aware, balanced {...} objects from an
// accumulator that may also carry free-form diagnostic text. The accumulator is cleared when it grows
// beyond maxBufferBytes.
std::unique_ptr<IContentFramer> MakeObjectScanFramer(std::size_t maxBufferBytes = 1024 * 1024);

} // namespace toolgw
