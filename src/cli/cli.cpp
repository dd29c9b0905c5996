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
 * @file cli.cpp
 * @brief Implementation of the `lineage-gen` front end.
 */

#include "lineage/cli/cli.hpp"

#include "lineage/codec/binary.hpp"
#include "lineage/codec/json.hpp"
#include "lineage/infra/string.hpp"

#include <algorithm>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace lineage::cli {

using core::Id;
using infra::Logger;
using infra::LogLevel;

namespace {

uint64_t parse_count(const std::string& flag, const std::string& text, uint64_t max)
{
    u128 v = infra::String::parse_u128(text);
    if (v > max) {
        throw std::out_of_range(flag + " is too large: " + text);
    }
    return static_cast<uint64_t>(v);
}

} // namespace

Config Cli::parse_args(int argc, const char* const argv[])
{
    Config config;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help") {
            config.help = true;
            continue;
        }

        // Every other option takes exactly one value.
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for '" + arg + "'");
        }
        const std::string value = argv[++i];

        if (arg == "--depth") {
            config.depth = static_cast<uint32_t>(parse_count(arg, value, UINT32_MAX));
        } else if (arg == "--fanout") {
            config.fanout = static_cast<uint32_t>(parse_count(arg, value, UINT32_MAX));
        } else if (arg == "--format") {
            if (value != "text" && value != "json" && value != "binary-hex") {
                throw std::invalid_argument("Unknown format '" + value + "'");
            }
            config.format = value;
        } else if (arg == "--audit") {
            if (value != "bfs" && value != "siblings") {
                throw std::invalid_argument("Unknown audit mode '" + value + "'");
            }
            config.audit = value;
        } else if (arg == "--count") {
            config.count = parse_count(arg, value, UINT64_MAX);
        } else if (arg == "--log-level") {
            config.log_level = Logger::parse_level(value);
        } else {
            throw std::invalid_argument("Unknown option '" + arg + "'");
        }
    }
    return config;
}

std::string Cli::render(const Id& id, const std::string& format)
{
    if (format == "json") {
        return codec::Json::encode(id);
    }
    if (format == "binary-hex") {
        auto record = codec::Binary::encode(id);
        return infra::String::hex_bytes(record.data(), record.size());
    }
    return id.to_string();
}

/**
 * @brief Pre-order walk with an explicit stack.
 *
 * Implementation Strategy:
 * 1. **Frames**: Each stack entry is a parent that still owes children, paired
 * with the number of levels left below it. The parent's own generation
 * counter tracks how many children it has produced.
 * 2. **Step**: Derive the next child of the top frame, visit it, and push it
 * when it has levels of its own to expand. Otherwise pop exhausted frames.
 */
void Cli::walk_tree(uint32_t depth, uint32_t fanout,
                    const std::function<void(const Id&)>& visit)
{
    Id root = Id::root();
    visit(root);
    if (depth == 0 || fanout == 0) {
        return;
    }

    std::vector<std::pair<Id, uint32_t>> stack;
    stack.emplace_back(root, depth);

    while (!stack.empty()) {
        Id& parent = stack.back().first;
        const uint32_t levels_left = stack.back().second;

        if (parent.num_children() >= fanout) {
            stack.pop_back();
            continue;
        }

        Id child = parent.derive_child();
        if (Logger::level() <= LogLevel::TRACE) {
            Logger::log(LogLevel::TRACE, "Tree: derived " + child.to_string() + " from " +
                                             parent.to_string() + " (child " +
                                             std::to_string(parent.num_children()) + ")");
        }
        visit(child);

        // emplace_back may reallocate; `parent` is not used past this point.
        if (levels_left > 1) {
            stack.emplace_back(child, levels_left - 1);
        }
    }
}

void Cli::print_tree(std::ostream& out, const Config& config)
{
    walk_tree(config.depth, config.fanout, [&](const Id& id) {
        std::fill_n(std::ostream_iterator<char>(out), static_cast<std::size_t>(id.depth()) * 2, ' ');
        out << render(id, config.format) << '\n';
    });
    out.flush();
}

int Cli::report_audit(std::ostream& out, const Config& config, const core::AuditReport& report)
{
    out << "audit=" << config.audit << " generated=" << report.generated
        << " collided=" << (report.collided ? "yes" : "no");
    if (report.collided) {
        out << " index=" << report.collision_index << " value=" << report.offender;
    }
    out << std::endl;

    return report.collided ? EXIT_COLLISION : EXIT_OK;
}

void Cli::print_help(std::ostream& out, const char* binary_name)
{
    out << "Usage: " << binary_name << " [OPTIONS]\n"
        << "Options:\n"
        << "  --depth N          Levels below the root to print (Default: 2)\n"
        << "  --fanout N         Children derived per identifier (Default: 2)\n"
        << "  --format FMT       text | json | binary-hex (Default: text)\n"
        << "  --audit MODE       Run a collision audit instead: bfs | siblings\n"
        << "  --count N          Derivations per audit (Default: 1000000)\n"
        << "  --log-level LEVEL  trace | debug | info | warn | error | fatal\n"
        << "  --help             Show this help message\n";
}

/**
 * @brief Parses, configures the logger, then prints a tree or runs an audit.
 */
int Cli::run(int argc, const char* const argv[], std::ostream& out)
{
    const char* binary_name = (argc > 0 && argv[0]) ? argv[0] : "lineage-gen";

    Config config;
    try {
        config = parse_args(argc, argv);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::ERROR, "Config: " + std::string(e.what()));
        print_help(out, binary_name);
        return EXIT_USAGE;
    }

    if (config.help) {
        print_help(out, binary_name);
        return EXIT_OK;
    }

    Logger::set_level(config.log_level);

    try {
        if (!config.audit.empty()) {
            core::AuditReport report = (config.audit == "bfs")
                                           ? core::Audit::breadth_first(config.count)
                                           : core::Audit::siblings(config.count);
            return report_audit(out, config, report);
        }

        Logger::log(LogLevel::DEBUG, "Tree: depth=" + std::to_string(config.depth) +
                                         " fanout=" + std::to_string(config.fanout) +
                                         " format=" + config.format);
        print_tree(out, config);

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return EXIT_USAGE;
    }

    return EXIT_OK;
}

} // namespace lineage::cli
