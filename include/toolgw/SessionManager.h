//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.h
// Purpose: In-process table of sessions keyed by opaque id
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "toolgw/Session.h"

namespace toolgw {

//==========================================================================================================
// SessionManager
// Purpose: Creates, looks up and deletes sessions. Sessions are shared_ptr so a caller holding one keeps
//          it usable after DeleteSession(); expiry only happens through CleanupExpired().
//==========================================================================================================
class SessionManager {
public:
    // 24 hours: the age used when CleanupExpired() is called without an argument.
    static constexpr std::chrono::milliseconds kDefaultMaxAge{24LL * 60 * 60 * 1000};

    explicit SessionManager(std::size_t maxHistoryItems = 50);

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // New session with id "session_<epoch-ms>_<random>".
    std::shared_ptr<Session> CreateSession();

    std::shared_ptr<Session> GetSession(const std::string& sessionId) const;

    //==========================================================================================================
    // GetOrCreateSession
    // Purpose: Looks up sessionId, creating a session under that id when absent. A blank id creates a
    //          session with a generated id.
    // Returns:
    //   {session, created}
    //==========================================================================================================
    std::pair<std::shared_ptr<Session>, bool> GetOrCreateSession(const std::string& sessionId);

    bool DeleteSession(const std::string& sessionId);

    std::size_t SessionCount() const;

    std::vector<std::string> ListSessions() const;

    // Removes sessions idle for longer than maxAge. Returns the number removed.
    std::size_t CleanupExpired(std::chrono::milliseconds maxAge = kDefaultMaxAge);

private:
    std::string generateSessionIdLocked() const;

    const std::size_t maxHistoryItems_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace toolgw
