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
 * @file audit.cpp
 * @brief Implementation of the breadth-first and sibling collision audits.
 */

#include "lineage/core/audit.hpp"

#include "lineage/infra/logger.hpp"
#include "lineage/infra/string.hpp"

#include <deque>
#include <string>
#include <unordered_set>

namespace lineage::core {

using infra::Logger;
using infra::LogLevel;

bool Audit::record(std::unordered_set<Id>& seen, const Id& child, uint64_t index, AuditReport& report)
{
    report.generated = index + 1;
    if (seen.insert(child).second) {
        return true;
    }

    report.collided = true;
    report.collision_index = index;
    report.offender = child;

    Logger::log(LogLevel::WARN, "Audit: collision at " + std::to_string(index) +
                                    " (value=" + child.to_string() +
                                    " local=" + infra::String::to_hex(child.local()) +
                                    " parent=" + infra::String::to_hex(child.parent_value()) +
                                    " depth=" + std::to_string(child.depth()) + ")");
    return false;
}

AuditReport Audit::breadth_first(uint64_t count)
{
    Logger::log(LogLevel::INFO,
                "Audit: breadth-first run over " + std::to_string(count) + " derivations");

    AuditReport report;
    std::unordered_set<Id> seen;
    std::deque<Id> queue;
    queue.push_back(Id::root());

    for (uint64_t i = 0; i < count; ++i) {
        Id current = queue.front();
        queue.pop_front();

        Id next = current.derive_child();
        if (!record(seen, next, i, report)) {
            return report;
        }

        queue.push_back(next);
        queue.push_back(current);
    }

    Logger::log(LogLevel::INFO,
                "Audit: no collision in " + std::to_string(report.generated) + " derivations");
    return report;
}

AuditReport Audit::siblings(uint64_t count)
{
    Logger::log(LogLevel::INFO,
                "Audit: sibling run over " + std::to_string(count) + " derivations");

    AuditReport report;
    std::unordered_set<Id> seen;
    Id root = Id::root();

    for (uint64_t i = 0; i < count; ++i) {
        if (!record(seen, root.derive_child(), i, report)) {
            return report;
        }
    }

    Logger::log(LogLevel::INFO,
                "Audit: no collision in " + std::to_string(report.generated) + " derivations");
    return report;
}

} // namespace lineage::core
