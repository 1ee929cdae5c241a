//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ObjectScanFramer.cpp
// Purpose: Brace-boundary framer for servers that interleave diagnostics with JSON output
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolgw/ContentFramer.h"

namespace toolgw {

namespace {
class ObjectScanFramer : public IContentFramer {
public:
    explicit ObjectScanFramer(std::size_t maxLen) : maxBufferBytes(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t start = buffer.find('{');
        if (start == std::string::npos) {
            if (buffer.size() > maxBufferBytes) {
                LOG_WARN("Output accumulator exceeded {} bytes; clearing", maxBufferBytes);
                return { DecodeStatus::TooLarge, std::nullopt, buffer.size(), {} };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0, {} };
        }

        int depth = 0;
        bool inString = false;
        bool escaped = false;
        for (std::size_t k = start; k < buffer.size(); ++k) {
            char c = buffer[k];
            if (inString) {
                if (escaped) {
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    inString = false;
                }
                continue;
            }
            if (c == '"') {
                inString = true;
            } else if (c == '{') {
                // A brace in column 0 opens a new top-level object; nested members are always indented.
                // Whatever was still open before it was diagnostic text with a stray brace.
                if (depth > 0 && k > 0 && buffer[k - 1] == '\n') {
                    start = k;
                    depth = 0;
                }
                ++depth;
            } else if (c == '}') {
                if (--depth == 0) {
                    std::string payload = buffer.substr(start, k - start + 1);
                    return { DecodeStatus::Ok, std::make_optional(std::move(payload)), k + 1,
                             buffer.substr(0, start) };
                }
            }
        }

        if (buffer.size() > maxBufferBytes) {
            LOG_WARN("Output accumulator exceeded {} bytes without a complete object; clearing", maxBufferBytes);
            return { DecodeStatus::TooLarge, std::nullopt, buffer.size(), {} };
        }
        // Object still open: leading text before it can go, the object itself must wait
        if (start > 0) {
            return { DecodeStatus::Skipped, std::nullopt, start, buffer.substr(0, start) };
        }
        return { DecodeStatus::Incomplete, std::nullopt, 0, {} };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        while (!buffer.empty()) {
            DecodeResult r = tryDecodeEx(buffer);
            if (!r.discarded.empty()) {
                LOG_DEBUG("Dropping non-message output: {}", r.discarded);
            }
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
    std::size_t maxBufferBytes;
};
} // namespace

std::unique_ptr<IContentFramer> MakeObjectScanFramer(std::size_t maxBufferBytes) {
    return std::make_unique<ObjectScanFramer>(maxBufferBytes);
}

} // namespace toolgw
