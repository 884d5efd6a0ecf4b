/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace motionq {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static LogLevel parseLevel(const std::string& text, LogLevel fallback) noexcept;

    // One line as written to stderr, without the trailing newline
    [[nodiscard]] static std::string format(LogLevel level, const std::string& message);

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context
void setThreadName(const std::string& name);

// Tags every line logged by the current thread with a job id while alive.
// Scopes nest; the previous id is restored on destruction.
class LogJobScope final {
public:
    explicit LogJobScope(const std::string& jobId);
    ~LogJobScope();

    LogJobScope(const LogJobScope&) = delete;
    LogJobScope& operator=(const LogJobScope&) = delete;
    LogJobScope(LogJobScope&&) = delete;
    LogJobScope& operator=(LogJobScope&&) = delete;

private:
    std::string previous_;
};

// Job id attached to the current thread's log lines, empty outside a scope
[[nodiscard]] const std::string& currentLogJob() noexcept;

}

#define LOG_ERROR(msg) ::motionq::Logger::error(msg)
#define LOG_WARN(msg)  ::motionq::Logger::warn(msg)
#define LOG_INFO(msg)  ::motionq::Logger::info(msg)
#define LOG_DEBUG(msg) ::motionq::Logger::debug(msg)
#define LOG_TRACE(msg) ::motionq::Logger::trace(msg)
