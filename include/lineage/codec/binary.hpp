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
 * @file binary.hpp
 * @brief Fixed-width binary record for an identifier's stored fields.
 *
 * @details
 * Layout (32 bytes, every field little-endian, no padding):
 *
 * | Offset | Width | Field              |
 * |--------|-------|--------------------|
 * | 0      | 8     | local              |
 * | 8      | 16    | parent_value       |
 * | 24     | 4     | depth              |
 * | 28     | 4     | generation_count   |
 *
 * The byte order is fixed regardless of the host so records can move between
 * machines unchanged.
 */

#pragma once

#include "lineage/codec/error.hpp"
#include "lineage/core/id.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace lineage::codec {

/**
 * @class Binary
 * @brief Static encoder/decoder for the 32-byte identifier record.
 */
class Binary {
  public:
    /// @brief Exact size of one encoded record in bytes.
    static constexpr std::size_t RECORD_SIZE = 32;

    using Record = std::array<uint8_t, RECORD_SIZE>;

    /**
     * @brief Writes the record into a caller-owned buffer.
     *
     * @param out Destination with room for at least `RECORD_SIZE` bytes.
     */
    static void encode(const core::Id& id, uint8_t* out) noexcept;

    /// @brief Returns the record by value.
    static Record encode(const core::Id& id) noexcept;

    /**
     * @brief Reads a record.
     *
     * @throws CodecError If @p data is null or @p len is not `RECORD_SIZE`.
     */
    static core::Id decode(const uint8_t* data, std::size_t len);
};

} // namespace lineage::codec
