//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logging for the tool gateway (console + optional file sink).
//==========================================================================================================
#pragma once

#include <cstdlib>
#include <format>
#include <string>

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

//==========================================================================================================
// Logger
// Purpose: Static sink shared by the library, the example program and the tests.
// Notes:
//   - Lines look like "2025-01-01T10:00:00.123Z [INFO] File.cpp:42: message".
//   - Console output goes to stdout, or to stderr when TOOLGW_STDIO_MODE=1 or setStderr(true) so a
//     gateway that talks to its own parent over stdout keeps that stream clean.
//   - TOOLGW_LOG_COLOR=0 disables the ANSI level labels; TOOLGW_LOG_LEVEL sets the initial level.
//==========================================================================================================
class Logger {
public:
    // Convert common level strings to LogLevel (case-insensitive). Unknown strings map to INFO.
    static LogLevel levelFromString(const std::string& lvl);

    // Variadic logging using C++20 std::vformat with runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            buffer = std::format("Format error: {} in \"{}\"", e.what(), fmt);
        }
        log(level, buffer, file, line);
    }

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line);

    static void setLogLevel(LogLevel level) { sLogLevel = level; }
    static bool enabled(LogLevel level) { return sLogLevel <= level; }

    // Appends to filePath in addition to the console. Failure is reported on stderr and leaves the
    // previous file (if any) closed.
    static void setLogFile(const std::string& filePath);

    static void setStderr(bool useStderr);

    static LogLevel sLogLevel;
};

#define TOOLGW_LOG_AT(lvl, name, fmt, ...) \
    do { if (Logger::enabled(lvl)) Logger::logf(name, fmt, __FILE__, __LINE__, ##__VA_ARGS__); } while (0)

#define LOG_DEBUG(fmt, ...) TOOLGW_LOG_AT(LogLevel::LOG_DEBUG_LEVEL, "DEBUG", fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  TOOLGW_LOG_AT(LogLevel::LOG_INFO_LEVEL, "INFO", fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  TOOLGW_LOG_AT(LogLevel::LOG_WARN_LEVEL, "WARN", fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) TOOLGW_LOG_AT(LogLevel::LOG_ERROR_LEVEL, "ERROR", fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while (0)

// Function entry/exit tracing, compiled in only for _DEBUG builds
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
