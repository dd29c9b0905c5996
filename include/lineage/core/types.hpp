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
 * @file types.hpp
 * @brief Fixed-width integer vocabulary shared by every Lineage module.
 */

#pragma once

#include <cstdint>

namespace lineage {

/**
 * @brief Unsigned 128-bit integer used for derived identifier values.
 *
 * Arithmetic on this type is modulo 2^128, which is exactly the wrapping
 * behaviour the derivation formula requires.
 */
__extension__ typedef unsigned __int128 u128;

/// @brief Builds a 128-bit value from its high and low 64-bit halves.
constexpr u128 make_u128(uint64_t high, uint64_t low) noexcept
{
    return (static_cast<u128>(high) << 64) | low;
}

/// @brief Upper 64 bits of a 128-bit value.
constexpr uint64_t high64(u128 v) noexcept
{
    return static_cast<uint64_t>(v >> 64);
}

/// @brief Lower 64 bits of a 128-bit value.
constexpr uint64_t low64(u128 v) noexcept
{
    return static_cast<uint64_t>(v);
}

} // namespace lineage
