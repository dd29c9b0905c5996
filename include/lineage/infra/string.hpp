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
 * @file string.hpp
 * @brief Text conversions for 128-bit values and input sanitizing.
 *
 * @details
 * The standard library streams cannot print or parse `unsigned __int128`.
 * This header defines the `String` utility class, which provides exact
 * hexadecimal and decimal conversions for identifier values plus the
 * whitespace trimming used when reading command-line and JSON input.
 */

#pragma once

#include "lineage/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace lineage::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed copy; empty if @p s is blank.
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Renders a value as `0x` followed by lowercase hex digits.
     *
     * No zero padding is applied: 0 renders as `0x0`, 255 as `0xff`.
     */
    static std::string to_hex(u128 v);

    /// @brief Renders a byte range as lowercase hex pairs, no prefix or separators.
    static std::string hex_bytes(const uint8_t* data, std::size_t len);

    /// @brief Renders a value in base 10 without separators.
    static std::string to_decimal(u128 v);

    /**
     * @brief Parses an unsigned base-10 integer into a 128-bit value.
     *
     * Surrounding whitespace is ignored.
     *
     * @throws std::invalid_argument If the input is empty or contains a non-digit.
     * @throws std::out_of_range If the number exceeds 2^128 - 1.
     *
     * @code
     * // Example Usage:
     * lineage::u128 v = lineage::infra::String::parse_u128(" 340282366920938463463374607431768211455 ");
     * @endcode
     */
    static u128 parse_u128(const std::string& s);
};

} // namespace lineage::infra
