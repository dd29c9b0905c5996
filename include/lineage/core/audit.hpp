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
 * @file audit.hpp
 * @brief Empirical collision audits over generated identifier streams.
 *
 * @details
 * Identifier uniqueness is probabilistic: a 64-bit FNV-1a digest can collide.
 * These routines generate long identifier streams from the root and record
 * every derived value, stopping at the first repeat. They are diagnostic tools
 * for measuring how soon a collision appears; they allocate freely and are not
 * part of the allocation-free core.
 */

#pragma once

#include "lineage/core/id.hpp"

#include <cstdint>
#include <unordered_set>

namespace lineage::core {

/**
 * @struct AuditReport
 * @brief Outcome of one audit run.
 */
struct AuditReport {
    uint64_t generated = 0;       ///< Number of children derived before stopping.
    bool collided = false;        ///< True if a derived value repeated.
    uint64_t collision_index = 0; ///< Zero-based index of the repeating derivation.
    Id offender;                  ///< The child whose value repeated (root if none).
};

/**
 * @class Audit
 * @brief Static collision audits.
 */
class Audit {
  public:
    /**
     * @brief Walks the derivation tree breadth-first.
     *
     * Starting from a queue holding `Id::root()`, each step pops the front id,
     * derives one child from it, records the child's value, then pushes the
     * child followed by the (now mutated) parent. Every id therefore keeps
     * producing children while the tree widens and deepens.
     *
     * @param count Maximum number of derivations.
     * @return AuditReport The first collision found, or a clean report.
     *
     * @warning Memory grows linearly with @p count.
     */
    static AuditReport breadth_first(uint64_t count);

    /**
     * @brief Derives @p count siblings directly from a single root.
     *
     * Exercises the generation counter as the only varying hash input.
     */
    static AuditReport siblings(uint64_t count);

    /**
     * @brief Records one derived child in the running audit.
     *
     * Updates `report.generated` to `index + 1`. When the child's value is
     * already in @p seen, fills the collision fields of @p report and logs a
     * WARN line.
     *
     * @return true If the value was new; false on a collision.
     */
    static bool record(std::unordered_set<Id>& seen, const Id& child, uint64_t index,
                       AuditReport& report);
};

} // namespace lineage::core
