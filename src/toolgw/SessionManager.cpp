//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.cpp
// Purpose: Session table
//==========================================================================================================

#include <algorithm>
#include <format>
#include <random>

#include "logging/Logger.h"
#include "toolgw/SessionManager.h"

namespace toolgw {

namespace {
std::string randomSuffix() {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dis(0, 35);
    std::string out;
    for (int i = 0; i < 7; ++i) {
        out.push_back(kAlphabet[dis(gen)]);
    }
    return out;
}
} // namespace

SessionManager::SessionManager(std::size_t maxHistoryItems) : maxHistoryItems_(maxHistoryItems) {}

std::string SessionManager::generateSessionIdLocked() const {
    for (;;) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        std::string id = std::format("session_{}_{}", static_cast<long long>(ms), randomSuffix());
        if (sessions_.find(id) == sessions_.end()) {
            return id;
        }
    }
}

std::shared_ptr<Session> SessionManager::CreateSession() {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = std::make_shared<Session>(generateSessionIdLocked(), maxHistoryItems_);
        sessions_.emplace(session->Id(), session);
    }
    LOG_INFO("Created new session: {}", session->Id());
    return session;
}

std::shared_ptr<Session> SessionManager::GetSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    return it == sessions_.end() ? nullptr : it->second;
}

std::pair<std::shared_ptr<Session>, bool> SessionManager::GetOrCreateSession(const std::string& sessionId) {
    if (sessionId.empty()) {
        return {CreateSession(), true};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it != sessions_.end()) {
        LOG_DEBUG("Retrieved existing session: {}", sessionId);
        return {it->second, false};
    }
    auto session = std::make_shared<Session>(sessionId, maxHistoryItems_);
    sessions_.emplace(sessionId, session);
    LOG_INFO("Created new session with ID: {}", sessionId);
    return {session, true};
}

bool SessionManager::DeleteSession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool erased = sessions_.erase(sessionId) > 0;
    if (erased) {
        LOG_INFO("Deleted session: {}", sessionId);
    }
    return erased;
}

std::size_t SessionManager::SessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionManager::ListSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& kv : sessions_) {
        ids.push_back(kv.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t SessionManager::CleanupExpired(std::chrono::milliseconds maxAge) {
    const auto now = Session::Clock::now();
    std::size_t removed = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second->LastActivity() > maxAge) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        LOG_INFO("Cleaned up {} expired sessions", removed);
    }
    return removed;
}

} // namespace toolgw
