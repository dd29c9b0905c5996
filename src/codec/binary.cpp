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
 * @file binary.cpp
 * @brief Implementation of the 32-byte little-endian identifier record.
 */

#include "lineage/codec/binary.hpp"

#include <string>

namespace lineage::codec {

namespace {

void put_le(uint8_t* out, uint64_t v, std::size_t width)
{
    for (std::size_t i = 0; i < width; ++i) {
        out[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

uint64_t get_le(const uint8_t* in, std::size_t width)
{
    uint64_t v = 0;
    for (std::size_t i = 0; i < width; ++i) {
        v |= static_cast<uint64_t>(in[i]) << (8 * i);
    }
    return v;
}

} // namespace

void Binary::encode(const core::Id& id, uint8_t* out) noexcept
{
    put_le(out, id.local(), 8);
    put_le(out + 8, low64(id.parent_value()), 8);
    put_le(out + 16, high64(id.parent_value()), 8);
    put_le(out + 24, id.depth(), 4);
    put_le(out + 28, id.num_children(), 4);
}

Binary::Record Binary::encode(const core::Id& id) noexcept
{
    Record record{};
    encode(id, record.data());
    return record;
}

core::Id Binary::decode(const uint8_t* data, std::size_t len)
{
    if (!data) {
        throw CodecError("Binary record: null buffer");
    }
    if (len != RECORD_SIZE) {
        throw CodecError("Binary record: expected " + std::to_string(RECORD_SIZE) +
                         " bytes, got " + std::to_string(len));
    }

    return core::Id::from_parts(get_le(data, 8), make_u128(get_le(data + 16, 8), get_le(data + 8, 8)),
                                static_cast<uint32_t>(get_le(data + 24, 4)),
                                static_cast<uint32_t>(get_le(data + 28, 4)));
}

} // namespace lineage::codec
