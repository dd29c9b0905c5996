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
 * @file string.cpp
 * @brief Implementation of the 128-bit text conversions.
 */

#include "lineage/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace lineage::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The use of `static_cast<unsigned char>` is critical to prevent undefined
 * behavior with `std::isspace` when encountering characters with negative values
 * in signed `char` environments.
 */
std::string String::trim(const std::string& s)
{
    // 1. Prefix Scan: Locate the first character that is NOT a whitespace.
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    // 2. Short-circuit: If the buffer is empty or exclusively whitespace,
    // return an empty string immediately.
    if (start == s.end()) {
        return "";
    }

    // 3. Suffix Scan: Locate the final character that is NOT a whitespace.
    // Starting from the terminal iterator and decrementing.
    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    // 4. Allocation: The range is [start, end + 1) so the terminal character is kept.
    return std::string(start, end + 1);
}

std::string String::to_hex(u128 v)
{
    static const char digits[] = "0123456789abcdef";

    if (v == 0) {
        return "0x0";
    }

    // Emit nibbles least-significant first, then reverse once.
    std::string out;
    while (v != 0) {
        out.push_back(digits[static_cast<unsigned>(v & 0xF)]);
        v >>= 4;
    }
    out += "x0";
    std::reverse(out.begin(), out.end());
    return out;
}

std::string String::hex_bytes(const uint8_t* data, std::size_t len)
{
    static const char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0xF]);
    }
    return out;
}

std::string String::to_decimal(u128 v)
{
    if (v == 0) {
        return "0";
    }

    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<unsigned>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

/**
 * @brief Parses a decimal string into a 128-bit value.
 *
 * Implementation Strategy:
 * 1. **Sanitize**: Trim surrounding whitespace; reject an empty remainder.
 * 2. **Accumulate**: Multiply-add per digit, checking against `max / 10`
 * before every step so the accumulator never wraps silently.
 */
u128 String::parse_u128(const std::string& s)
{
    // 1. Sanitize: drop surrounding whitespace before validating digits.
    const std::string text = trim(s);
    if (text.empty()) {
        throw std::invalid_argument("parse_u128: empty input");
    }

    const u128 max = ~static_cast<u128>(0);
    u128 result = 0;

    // 2. Accumulate: reject the digit that would push past 2^128 - 1.
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("parse_u128: invalid digit in '" + text + "'");
        }
        const unsigned digit = static_cast<unsigned>(c - '0');
        if (result > max / 10 || (result == max / 10 && digit > static_cast<unsigned>(max % 10))) {
            throw std::out_of_range("parse_u128: value exceeds 128 bits: '" + text + "'");
        }
        result = result * 10 + digit;
    }
    return result;
}

} // namespace lineage::infra
