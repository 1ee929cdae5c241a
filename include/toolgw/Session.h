//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: Per-conversation context blob and bounded action history
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "toolgw/JSONRPCTypes.h"

namespace toolgw {

enum class HistoryItemType {
    ContextUpdate,
    ActionExecution,
    UserOperation
};

// "context_update", "action_execution", "user_operation"
const char* HistoryItemTypeName(HistoryItemType type);

struct HistoryItem {
    HistoryItemType type;
    int64_t timestamp;   // milliseconds since the Unix epoch
    JSONValue data;
};

// {type, timestamp, data}
JSONValue HistoryItemToJSON(const HistoryItem& item);

//==========================================================================================================
// Session
// Purpose: One unit of conversational continuity.
// Notes:
//   - Every accessor and mutator takes the session's own mutex; a read-modify-write such as
//     MergeContext() is therefore atomic with respect to other calls on the same session.
//   - History is append-only and trimmed from the front beyond maxHistoryItems.
//   - A caller that reads the context, derives an update from it and writes it back holds
//     LockActions() for the whole sequence. That lock is separate from the data mutex.
//==========================================================================================================
class Session {
public:
    using Clock = std::chrono::system_clock;

    explicit Session(std::string id, std::size_t maxHistoryItems = 50);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& Id() const { return id_; }

    // Snapshot of the context (an empty object until first set).
    JSONValue Context() const;

    // Replaces the context wholesale and appends a context_update entry.
    void UpdateContext(JSONValue newContext);

    //==========================================================================================================
    // MergeContext
    // Purpose: Shallow merge of delta's members over the current context as one serialized step.
    // Returns:
    //   The merged context.
    // Throws:
    //   errors::GatewayException(InvalidParams) when delta is not an object.
    //==========================================================================================================
    JSONValue MergeContext(const JSONValue& delta);

    // Serializes read-derive-write sequences on this session.
    [[nodiscard]] std::unique_lock<std::mutex> LockActions();

    // Appends an action_execution entry {action, parameters, resultSummary}.
    void RecordAction(const std::string& action, const JSONValue& parameters, const JSONValue& result);

    // Appends an entry of any type with caller-supplied data.
    void RecordEvent(HistoryItemType type, JSONValue data);

    std::vector<HistoryItem> History() const;
    std::size_t HistorySize() const;

    Clock::time_point CreatedAt() const { return createdAt_; }
    Clock::time_point LastActivity() const;

private:
    void appendLocked(HistoryItemType type, JSONValue data);
    static JSONValue contextUpdateData(const JSONValue& context);

    const std::string id_;
    const std::size_t maxHistoryItems_;
    const Clock::time_point createdAt_;

    std::mutex actionMutex_;
    mutable std::mutex mutex_;
    JSONValue context_;
    std::vector<HistoryItem> history_;
    Clock::time_point lastActivity_;
};

} // namespace toolgw
