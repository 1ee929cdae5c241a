//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingOperations.h
// Purpose: Table of in-flight requests awaiting a correlated response, with per-entry deadlines
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolgw/JSONRPCTypes.h"

namespace toolgw {

//==========================================================================================================
// PendingOperations
// Purpose: Maps operation ids to the promise handed back to the caller. Every entry completes exactly
//          once: by Complete(), by Fail()/FailAll(), or by ExpireDue() when its deadline passes. Whichever
//          path removes the entry first wins; later attempts for the same id are no-ops.
//==========================================================================================================
class PendingOperations {
public:
    using Clock = std::chrono::steady_clock;
    using ResponseFuture = std::future<std::unique_ptr<JSONRPCResponse>>;

    PendingOperations() = default;
    ~PendingOperations();

    PendingOperations(const PendingOperations&) = delete;
    PendingOperations& operator=(const PendingOperations&) = delete;

    //==========================================================================================================
    // Add
    // Purpose: Registers an operation. timeout of zero disables the deadline.
    // Returns:
    //   Future for the correlated response (or error response).
    //==========================================================================================================
    ResponseFuture Add(const std::string& id, const std::string& requestType, std::chrono::milliseconds timeout);

    // Resolves the entry with the given response. Returns false if the id is unknown (already completed).
    bool Complete(const std::string& id, std::unique_ptr<JSONRPCResponse> response);

    // Resolves the entry with an error object. Returns false if the id is unknown.
    bool Fail(const std::string& id, int code, const std::string& message);

    // Resolves every entry with the same error. Returns the number of entries failed.
    std::size_t FailAll(int code, const std::string& message);

    // Resolves every entry whose deadline is at or before now with a Timeout error.
    std::size_t ExpireDue(Clock::time_point now);

    bool Contains(const std::string& id) const;
    std::size_t Size() const;

    // Request type recorded for an id ("" when unknown).
    std::string RequestType(const std::string& id) const;

private:
    struct Entry {
        std::promise<std::unique_ptr<JSONRPCResponse>> promise;
        std::string requestType;
        std::chrono::milliseconds timeout{0};
        Clock::time_point deadline{Clock::time_point::max()};
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace toolgw
