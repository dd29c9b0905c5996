/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 *
 * @details
 * Formats each entry as `[YYYY-MM-DD HH:MM:SS] [TAG] message` with ANSI
 * colour codes per severity.
 */

#include "lineage/infra/logger.hpp"

#include "lineage/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace lineage::infra {

// Define and initialize the static synchronization primitives.
std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::threshold_{LogLevel::INFO};

void Logger::set_level(LogLevel level)
{
    threshold_.store(level);
}

LogLevel Logger::level()
{
    return threshold_.load();
}

LogLevel Logger::parse_level(const std::string& name)
{
    std::string key = String::trim(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "trace")
        return LogLevel::TRACE;
    if (key == "debug")
        return LogLevel::DEBUG;
    if (key == "info")
        return LogLevel::INFO;
    if (key == "warn")
        return LogLevel::WARN;
    if (key == "error")
        return LogLevel::ERROR;
    if (key == "fatal")
        return LogLevel::FATAL;

    throw std::invalid_argument("Unknown log level '" + name + "'");
}

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops entries below the configured threshold.
 * 2. **Synchronization**: Acquires a `lock_guard` to prevent interleaved output.
 * 3. **Stream Segregation**: Routes messages to `stdout` or `stderr` based on severity.
 * 4. **Stylization**: Injects ANSI escape sequences for visual categorization.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    // Drop filtered entries before contending for the lock.
    if (level < threshold_.load()) {
        return;
    }

    // Ensure atomicity of the entire logging operation across concurrent threads.
    std::lock_guard<std::mutex> lock(mutex_);

    // Capture system time for precise event sequencing.
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    // Select target stream based on the criticality of the event.
    // High-priority events (WARN and above) bypass stdout to avoid buffering delays.
    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Formatting: [YYYY-MM-DD HH:MM:SS]
    // Note: Mutex protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    // Apply ANSI escape sequences for severity color-coding.
    switch (level) {
    case LogLevel::TRACE:
        // Gray (Dimmed) - Per-identifier derivation detail.
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        // Cyan - Internal state and configuration echoes.
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        // Green - Nominal operational status.
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        // Yellow - Collisions and other non-fatal anomalies.
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        // Red - Rejected input.
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        // Bold Red - Terminal failures.
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    // Append payload, reset terminal style, and force stream flush.
    stream << message << "\033[0m" << std::endl;
}

} // namespace lineage::infra
