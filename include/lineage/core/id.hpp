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
 * @file id.hpp
 * @brief Deterministic hierarchical 128-bit identifiers.
 *
 * @details
 * This header declares `Id`, a small value type that can cheaply derive new,
 * unique children without a central allocator, a random source or any heap
 * allocation. Every identifier remembers its parent's value, its depth in the
 * generation tree and how many children it has produced; the public 128-bit
 * number is computed from those fields on demand.
 *
 * All algorithms are deterministic and platform-independent: the same chain of
 * `root()` and `derive_child()` calls yields bit-identical identifiers on every
 * machine.
 */

#pragma once

#include "lineage/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>

namespace lineage::core {

/**
 * @class Id
 * @brief A unique, 128-bit numerical identifier that can generate new ids.
 *
 * @details
 * **Stored fields** (the complete persisted state, see the codecs):
 * - `local`: the 64-bit FNV-1a output of the derivation step that created this id.
 * - `parent_value`: the parent's derived value at derivation time.
 * - `depth`: number of ancestors.
 * - `generation_count`: number of children derived from this id so far.
 *
 * **Derived value:** `(depth + 1) * (parent_value ^ local)`, modulo 2^128.
 * Equality, hashing and display use the derived value only.
 *
 * **Ordering:** `a < b` compares depth only. Two ids of equal depth are
 * equivalent for ordering even when their values differ, so this is a weak
 * ordering. Sorting with an unstable algorithm may reorder equal-depth ids
 * differently between runs or implementations.
 *
 * @warning `derive_child()` mutates the receiver's generation counter and
 * performs no synchronization. Callers sharing one id across threads must
 * serialize access themselves.
 */
class Id {
  public:
    /// @brief Equivalent to `root()`.
    constexpr Id() = default;

    /**
     * @brief Returns the root-level id: every field zero, value 0.
     *
     * @note Subsequent calls return *the same id*, which will derive *the same
     * children*. Two independently created roots cannot be told apart.
     */
    static constexpr Id root() { return Id(); }

    /**
     * @brief Rebuilds an id from its four stored fields.
     *
     * Used by the codecs when reading a persisted identifier. No validation is
     * performed: every combination of fields is a valid id.
     */
    static constexpr Id from_parts(uint64_t local, u128 parent_value, uint32_t depth,
                                   uint32_t generation_count)
    {
        Id id;
        id.local_ = local;
        id.parent_value_ = parent_value;
        id.depth_ = depth;
        id.generation_count_ = generation_count;
        return id;
    }

    /**
     * @brief Returns the derived 128-bit value. Returns 0 for the root id.
     */
    constexpr u128 value() const
    {
        return (static_cast<u128>(depth_) + 1) * (parent_value_ ^ static_cast<u128>(local_));
    }

    /// @brief Derived value of the parent at derivation time; 0 for the root.
    constexpr u128 parent_value() const { return parent_value_; }

    /// @brief Number of ancestors.
    constexpr uint32_t depth() const { return depth_; }

    /// @brief Number of direct children produced so far (wraps after 2^32).
    constexpr uint32_t num_children() const { return generation_count_; }

    /// @brief Raw local id (the hash output), not the derived value.
    constexpr uint64_t local() const { return local_; }

    /**
     * @brief Derives a new, unique child from this id.
     *
     * Increments this id's generation counter (wrapping) and hashes, in order,
     * `local`, `parent_value`, `depth` and the incremented counter with
     * FNV-1a over their little-endian bytes. The digest becomes the child's
     * local id; the child's parent value is this id's current value and its
     * depth is one more than this id's depth.
     *
     * Never fails and never allocates.
     *
     * @return Id The new child, owned by the caller.
     */
    Id derive_child() noexcept;

    /**
     * @brief Renders the derived value as `0x` followed by lowercase hex.
     */
    std::string to_string() const;

  private:
    uint64_t local_ = 0;
    u128 parent_value_ = 0;
    uint32_t depth_ = 0;
    uint32_t generation_count_ = 0;
};

/// @brief Equal iff the derived values are equal (raw fields may differ).
constexpr bool operator==(const Id& lhs, const Id& rhs)
{
    return lhs.value() == rhs.value();
}

constexpr bool operator!=(const Id& lhs, const Id& rhs)
{
    return !(lhs == rhs);
}

/// @brief Depth-only weak ordering. Equal-depth ids are never less than each other.
constexpr bool operator<(const Id& lhs, const Id& rhs)
{
    return lhs.depth() < rhs.depth();
}

constexpr bool operator>(const Id& lhs, const Id& rhs)
{
    return rhs < lhs;
}

constexpr bool operator<=(const Id& lhs, const Id& rhs)
{
    return !(rhs < lhs);
}

constexpr bool operator>=(const Id& lhs, const Id& rhs)
{
    return !(lhs < rhs);
}

/// @brief Writes the `0x`-prefixed hex form of the derived value.
std::ostream& operator<<(std::ostream& os, const Id& id);

/**
 * @brief Hash of the derived value: FNV-1a over its 16 little-endian bytes.
 *
 * Equal ids always hash identically.
 */
uint64_t hash_value(const Id& id) noexcept;

} // namespace lineage::core

namespace std {
template <> struct hash<lineage::core::Id> {
    size_t operator()(const lineage::core::Id& id) const noexcept
    {
        return static_cast<size_t>(lineage::core::hash_value(id));
    }
};
} // namespace std
