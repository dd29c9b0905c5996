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
 * @file fnv.hpp
 * @brief Streaming FNV-1a (64-bit) mixing function.
 *
 * @details
 * FNV-1a is a fast, non-cryptographic hash. Lineage uses it to turn a parent's
 * state into a child's local id, so the parameters and the byte encoding of
 * every integer are fixed here: integers are always fed **little-endian**,
 * independent of the host byte order. Two hashers fed the same sequence of
 * writes produce the same digest on every platform.
 */

#pragma once

#include "lineage/core/types.hpp"

#include <cstddef>
#include <cstdint>

namespace lineage::infra {

/**
 * @class Fnv1a
 * @brief Incremental 64-bit FNV-1a hasher.
 *
 * @code
 * // Example Usage:
 * lineage::infra::Fnv1a h;
 * h.write_u64(42);
 * h.write_u32(7);
 * uint64_t digest = h.finish();
 * @endcode
 */
class Fnv1a {
  public:
    static constexpr uint64_t OFFSET_BASIS = 0xcbf29ce484222325ULL;
    static constexpr uint64_t PRIME = 0x100000001b3ULL;

    constexpr Fnv1a() noexcept = default;

    /// @brief Absorbs a raw byte range in order.
    constexpr void write(const uint8_t* bytes, std::size_t len) noexcept
    {
        for (std::size_t i = 0; i < len; ++i) {
            state_ ^= bytes[i];
            state_ *= PRIME;
        }
    }

    /// @brief Absorbs the 4 little-endian bytes of @p v.
    constexpr void write_u32(uint32_t v) noexcept { write_le(v, 4); }

    /// @brief Absorbs the 8 little-endian bytes of @p v.
    constexpr void write_u64(uint64_t v) noexcept { write_le(v, 8); }

    /// @brief Absorbs the 16 little-endian bytes of @p v (low half first).
    constexpr void write_u128(u128 v) noexcept
    {
        write_le(low64(v), 8);
        write_le(high64(v), 8);
    }

    /// @brief Returns the current digest. The hasher may keep absorbing afterwards.
    constexpr uint64_t finish() const noexcept { return state_; }

  private:
    constexpr void write_le(uint64_t v, int width) noexcept
    {
        for (int i = 0; i < width; ++i) {
            state_ ^= static_cast<uint8_t>(v >> (8 * i));
            state_ *= PRIME;
        }
    }

    uint64_t state_ = OFFSET_BASIS;
};

} // namespace lineage::infra
