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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for Lineage.
 *
 * @details
 * This header declares the `Logger` class, the reporting interface used by the
 * codecs, the collision audits and the `lineage-gen` tool. Output to the
 * standard streams is serialized so concurrent callers never interleave lines.
 * The identifier core itself never logs.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace lineage::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-identifier details (e.g., every derived child).
    DEBUG, ///< Diagnostic information intended for development and troubleshooting.
    INFO,  ///< Nominal operational events (e.g., audit start and summary).
    WARN,  ///< Non-blocking anomalies such as a detected value collision.
    ERROR, ///< Rejected input (bad arguments, malformed records).
    FATAL  ///< Failures that end the process.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the configured minimum level are dropped before the lock is
 * taken. The default minimum level is `INFO`.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @code
     * // Example Usage:
     * lineage::infra::Logger::log(LogLevel::INFO, "Audit: starting breadth-first run.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that will be written.
    static void set_level(LogLevel level);

    /// @brief Returns the minimum severity currently written.
    static LogLevel level();

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     *
     * Matching is case-insensitive.
     *
     * @throws std::invalid_argument If the name is not a known level.
     */
    static LogLevel parse_level(const std::string& name);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved writes.
    static std::mutex mutex_;

    /// @brief Minimum severity that passes the filter.
    static std::atomic<LogLevel> threshold_;
};

} // namespace lineage::infra
