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
 * @file id.cpp
 * @brief Implementation of the identifier derivation step.
 *
 * @details
 * The derivation feeds the parent's state into FNV-1a in a fixed field order
 * and byte order. Changing either breaks bit-compatibility with every
 * previously generated id, so both are treated as part of the format.
 */

#include "lineage/core/id.hpp"

#include "lineage/infra/fnv.hpp"
#include "lineage/infra/string.hpp"

#include <ostream>

namespace lineage::core {

/**
 * @brief Derives the next child id.
 *
 * Implementation Strategy:
 * 1. **Counter**: Bump the generation counter first (unsigned, so it wraps).
 * 2. **Mixing**: Hash `local`, `parent_value`, `depth`, then the bumped counter.
 * The counter is the only input that differs between siblings.
 * 3. **Linkage**: The child records this id's value, which never reads the
 * counter and therefore stays the same for every sibling.
 */
Id Id::derive_child() noexcept
{
    ++generation_count_;

    infra::Fnv1a state;
    state.write_u64(local_);
    state.write_u128(parent_value_);
    state.write_u32(depth_);
    state.write_u32(generation_count_);

    return Id::from_parts(state.finish(), value(), depth_ + 1, 0);
}

std::string Id::to_string() const
{
    return infra::String::to_hex(value());
}

std::ostream& operator<<(std::ostream& os, const Id& id)
{
    return os << id.to_string();
}

uint64_t hash_value(const Id& id) noexcept
{
    infra::Fnv1a state;
    state.write_u128(id.value());
    return state.finish();
}

} // namespace lineage::core
