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
 * @file cli.hpp
 * @brief Command-line front end of the `lineage-gen` tool.
 *
 * @details
 * Everything the tool does lives here so `main` stays a one-line bootstrap:
 * argument parsing, rendering, the derivation-tree walk and audit reporting.
 * Output goes to a caller-supplied stream; diagnostics go through the Logger.
 */

#pragma once

#include "lineage/core/audit.hpp"
#include "lineage/core/id.hpp"
#include "lineage/infra/logger.hpp"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>

namespace lineage::cli {

/**
 * @struct Config
 * @brief Runtime options collected from the command line.
 */
struct Config {
    uint32_t depth = 2;          ///< Levels printed below the root.
    uint32_t fanout = 2;         ///< Children derived per identifier.
    std::string format = "text"; ///< `text`, `json` or `binary-hex`.
    std::string audit;           ///< Empty, `bfs` or `siblings`.
    uint64_t count = 1000000;    ///< Derivations per audit.
    infra::LogLevel log_level = infra::LogLevel::INFO;
    bool help = false;
};

/**
 * @class Cli
 * @brief Static entry points of the `lineage-gen` tool.
 */
class Cli {
  public:
    /// @brief Exit status for a successful run.
    static constexpr int EXIT_OK = 0;
    /// @brief Exit status for invalid arguments or a runtime failure.
    static constexpr int EXIT_USAGE = 1;
    /// @brief Exit status when an audit found a collision.
    static constexpr int EXIT_COLLISION = 2;

    /**
     * @brief Parses `argv` into a `Config`.
     *
     * @throws std::invalid_argument On an unknown flag, a missing value or a bad value.
     * @throws std::out_of_range If a numeric value exceeds its field width.
     */
    static Config parse_args(int argc, const char* const argv[]);

    /// @brief Renders one identifier in the requested output format.
    static std::string render(const core::Id& id, const std::string& format);

    /**
     * @brief Walks the derivation tree from the root in pre-order.
     *
     * Every identifier is visited before its subtree; siblings are derived and
     * visited in generation order. The walk uses an explicit stack bounded by
     * @p depth, so arbitrarily deep chains do not grow the call stack.
     */
    static void walk_tree(uint32_t depth, uint32_t fanout,
                          const std::function<void(const core::Id&)>& visit);

    /// @brief Prints the tree, one identifier per line, indented two spaces per level.
    static void print_tree(std::ostream& out, const Config& config);

    /**
     * @brief Prints an audit summary line.
     *
     * @return int `EXIT_COLLISION` if the report holds a collision, else `EXIT_OK`.
     */
    static int report_audit(std::ostream& out, const Config& config,
                            const core::AuditReport& report);

    /// @brief Prints usage instructions.
    static void print_help(std::ostream& out, const char* binary_name);

    /**
     * @brief Runs the tool end to end and returns its exit status.
     *
     * Invalid arguments log an ERROR, print usage to @p out and return
     * `EXIT_USAGE`.
     */
    static int run(int argc, const char* const argv[], std::ostream& out);
};

} // namespace lineage::cli
