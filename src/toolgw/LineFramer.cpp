//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.cpp
// Purpose: Newline-delimited framer for the stdio process protocol
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolgw/ContentFramer.h"

namespace toolgw {

namespace {
bool isBlank(const std::string& s) {
    for (char c : s) {
        if (c != ' ' && c != '\t' && c != '\r') {
            return false;
        }
    }
    return true;
}

class LineFramer : public IContentFramer {
public:
    explicit LineFramer(std::size_t maxLen) : maxLineBytes(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t eol = buffer.find('\n');
        if (eol == std::string::npos) {
            if (buffer.size() > maxLineBytes) {
                // Drop what we have and keep dropping until the line terminator shows up
                LOG_WARN("Output line exceeds {} bytes; discarding", maxLineBytes);
                discarding = true;
                return { DecodeStatus::TooLarge, std::nullopt, buffer.size(), {} };
            }
            if (discarding) {
                return { DecodeStatus::Skipped, std::nullopt, buffer.size(), {} };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0, {} };
        }

        if (discarding) {
            discarding = false;
            return { DecodeStatus::TooLarge, std::nullopt, eol + 1, {} };
        }

        std::string line = buffer.substr(0, eol);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() > maxLineBytes) {
            LOG_WARN("Output line of {} bytes exceeds limit {}; discarding", line.size(), maxLineBytes);
            return { DecodeStatus::TooLarge, std::nullopt, eol + 1, {} };
        }
        if (isBlank(line)) {
            return { DecodeStatus::Skipped, std::nullopt, eol + 1, {} };
        }
        return { DecodeStatus::Ok, std::make_optional(std::move(line)), eol + 1, {} };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        while (!buffer.empty()) {
            DecodeResult r = tryDecodeEx(buffer);
            if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
                buffer.erase(0, r.bytesConsumed);
            }
            if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
                return r.payload;
            }
            if (r.status == DecodeStatus::Incomplete || r.bytesConsumed == 0) {
                break;
            }
        }
        return std::nullopt;
    }

private:
    std::size_t maxLineBytes;
    bool discarding{false};
};
} // namespace

std::unique_ptr<IContentFramer> MakeLineFramer(std::size_t maxLineBytes) {
    return std::make_unique<LineFramer>(maxLineBytes);
}

} // namespace toolgw
