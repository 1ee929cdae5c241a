//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks and formatting. Initial level honours TOOLGW_LOG_LEVEL.
//==========================================================================================================

#include "logging/Logger.h"

#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

#include "env/EnvVars.h"

namespace {
std::mutex gLogMutex;
std::ofstream gLogFile;

bool envFlag(const char* name, const char* fallback) {
    const std::string v = GetEnvOrDefault(name, fallback);
    return v == "1" || v == "true" || v == "TRUE";
}

std::atomic<bool> gUseStderr{envFlag("TOOLGW_STDIO_MODE", "0")};

// UTC with millisecond precision
std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm buf{};
    ::gmtime_r(&secs, &buf);
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", buf.tm_year + 1900, buf.tm_mon + 1,
                       buf.tm_mday, buf.tm_hour, buf.tm_min, buf.tm_sec, static_cast<int>(ms));
}

const char* labelColor(const char* level) {
    if (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0) {
        return "\033[38;5;88m";
    }
    if (::strncmp(level, "WARN", 4) == 0) {
        return "\033[33m";
    }
    return "\033[35m";
}
} // namespace

LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("TOOLGW_LOG_LEVEL", "INFO"));

LogLevel Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) {
        s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    }
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
    return LogLevel::LOG_INFO_LEVEL;
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    static const bool colorEnabled = envFlag("TOOLGW_LOG_COLOR", "1");
    const char* base = ::strrchr(file, '/');
    const char* shortFile = base ? base + 1 : file;
    const std::string ts = timestamp();

    const std::string plain = std::format("{} [{}] {}:{}: {}\n", ts, level, shortFile, line, msg);
    const std::string console = colorEnabled
        ? std::format("{} [{}{}\033[0m] {}:{}: {}\n", ts, labelColor(level), level, shortFile, line, msg)
        : plain;

    std::lock_guard<std::mutex> lock(gLogMutex);
    std::ostream& out = gUseStderr.load() ? std::cerr : std::cout;
    out << console;
    out.flush();
    if (gLogFile.is_open()) {
        gLogFile << plain;
        gLogFile.flush();
    }
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) {
        gLogFile.close();
    }
    gLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!gLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    gLogFile << "\n=== Log opened at " << timestamp() << " ===\n";
    gLogFile.flush();
}

void Logger::setStderr(bool useStderr) {
    gUseStderr.store(useStderr);
}
