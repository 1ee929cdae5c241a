//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Session context and history
//==========================================================================================================

#include "toolgw/Session.h"
#include "toolgw/errors/Errors.h"

namespace toolgw {

namespace {
int64_t epochMs(Session::Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}
} // namespace

const char* HistoryItemTypeName(HistoryItemType type) {
    switch (type) {
        case HistoryItemType::ContextUpdate: return "context_update";
        case HistoryItemType::ActionExecution: return "action_execution";
        case HistoryItemType::UserOperation: return "user_operation";
    }
    return "unknown";
}

JSONValue HistoryItemToJSON(const HistoryItem& item) {
    JSONValue::Object obj;
    SetMember(obj, "type", JSONValue(HistoryItemTypeName(item.type)));
    SetMember(obj, "timestamp", JSONValue(item.timestamp));
    SetMember(obj, "data", item.data);
    return JSONValue(std::move(obj));
}

Session::Session(std::string id, std::size_t maxHistoryItems)
    : id_(std::move(id)),
      maxHistoryItems_(maxHistoryItems == 0 ? 1 : maxHistoryItems),
      createdAt_(Clock::now()),
      context_(JSONValue::Object{}),
      lastActivity_(createdAt_) {}

JSONValue Session::Context() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_;
}

void Session::UpdateContext(JSONValue newContext) {
    std::lock_guard<std::mutex> lock(mutex_);
    context_ = std::move(newContext);
    appendLocked(HistoryItemType::ContextUpdate, contextUpdateData(context_));
}

JSONValue Session::MergeContext(const JSONValue& delta) {
    if (!delta.IsObject()) {
        throw errors::GatewayException(errors::ErrorCategory::InvalidParams, "Context delta must be an object");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    JSONValue::Object merged;
    if (context_.IsObject()) {
        merged = std::get<JSONValue::Object>(context_.value);
    }
    for (const auto& [key, value] : std::get<JSONValue::Object>(delta.value)) {
        merged[key] = value ? std::make_shared<JSONValue>(*value) : std::make_shared<JSONValue>(nullptr);
    }
    context_ = JSONValue(std::move(merged));
    appendLocked(HistoryItemType::ContextUpdate, contextUpdateData(context_));
    return context_;
}

std::unique_lock<std::mutex> Session::LockActions() {
    return std::unique_lock<std::mutex>(actionMutex_);
}

void Session::RecordAction(const std::string& action, const JSONValue& parameters, const JSONValue& result) {
    JSONValue::Object data;
    SetMember(data, "action", JSONValue(action));
    SetMember(data, "parameters", parameters);
    SetMember(data, "resultSummary", JSONValue(GetString(result, "message").value_or("Action executed")));
    std::lock_guard<std::mutex> lock(mutex_);
    appendLocked(HistoryItemType::ActionExecution, JSONValue(std::move(data)));
}

void Session::RecordEvent(HistoryItemType type, JSONValue data) {
    std::lock_guard<std::mutex> lock(mutex_);
    appendLocked(type, std::move(data));
}

std::vector<HistoryItem> Session::History() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

std::size_t Session::HistorySize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

Session::Clock::time_point Session::LastActivity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastActivity_;
}

void Session::appendLocked(HistoryItemType type, JSONValue data) {
    lastActivity_ = Clock::now();
    history_.push_back(HistoryItem{type, epochMs(lastActivity_), std::move(data)});
    if (history_.size() > maxHistoryItems_) {
        history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(history_.size() - maxHistoryItems_));
    }
}

JSONValue Session::contextUpdateData(const JSONValue& context) {
    int64_t selected = 0;
    if (const JSONValue* sel = FindMember(context, "selectedElements"); sel && sel->IsArray()) {
        selected = static_cast<int64_t>(std::get<JSONValue::Array>(sel->value).size());
    }
    JSONValue::Object data;
    SetMember(data, "summary", JSONValue(GetString(context, "summary").value_or("")));
    SetMember(data, "selectedElementCount", JSONValue(selected));
    return JSONValue(std::move(data));
}

} // namespace toolgw
