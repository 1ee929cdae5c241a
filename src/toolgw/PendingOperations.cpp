//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingOperations.cpp
// Purpose: Exactly-once completion of correlated requests
//==========================================================================================================

#include <format>

#include "logging/Logger.h"
#include "toolgw/PendingOperations.h"

namespace toolgw {

PendingOperations::~PendingOperations() {
    // Never leave a caller waiting on a broken promise
    (void)FailAll(JSONRPCErrorCodes::ProcessExited, "Process terminated");
}

PendingOperations::ResponseFuture PendingOperations::Add(const std::string& id, const std::string& requestType,
                                                         std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    Entry entry;
    entry.requestType = requestType;
    entry.timeout = timeout;
    if (timeout.count() > 0) {
        entry.deadline = Clock::now() + timeout;
    }
    auto future = entry.promise.get_future();
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entries_.emplace(id, std::move(entry));
    if (!inserted) {
        // Duplicate id: the new caller gets an immediate error, the original entry stays intact
        LOG_ERROR("Duplicate operation id '{}'", id);
        std::promise<std::unique_ptr<JSONRPCResponse>> dup;
        auto dupFuture = dup.get_future();
        dup.set_value(CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest,
                                          std::format("Duplicate operation id: {}", id)));
        return dupFuture;
    }
    return future;
}

bool PendingOperations::Complete(const std::string& id, std::unique_ptr<JSONRPCResponse> response) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }
        promise = std::move(it->second.promise);
        entries_.erase(it);
    }
    if (response) {
        response->id = id;
    } else {
        response = CreateErrorResponse(id, JSONRPCErrorCodes::InternalError, "Null response");
    }
    promise.set_value(std::move(response));
    return true;
}

bool PendingOperations::Fail(const std::string& id, int code, const std::string& message) {
    return Complete(id, CreateErrorResponse(id, code, message));
}

std::size_t PendingOperations::FailAll(int code, const std::string& message) {
    FUNC_SCOPE();
    std::unordered_map<std::string, Entry> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(entries_);
    }
    for (auto& [id, entry] : drained) {
        entry.promise.set_value(CreateErrorResponse(id, code, message));
    }
    return drained.size();
}

std::size_t PendingOperations::ExpireDue(Clock::time_point now) {
    std::vector<std::pair<std::string, Entry>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.deadline <= now) {
                expired.emplace_back(it->first, std::move(it->second));
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& [id, entry] : expired) {
        LOG_WARN("Operation '{}' ({}) timed out", id, entry.requestType);
        entry.promise.set_value(CreateErrorResponse(
            id, JSONRPCErrorCodes::Timeout,
            std::format("Request timed out after {}ms", static_cast<long long>(entry.timeout.count()))));
    }
    return expired.size();
}

bool PendingOperations::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(id) != 0;
}

std::size_t PendingOperations::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string PendingOperations::RequestType(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? std::string() : it->second.requestType;
}

} // namespace toolgw
