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
 * @file json.hpp
 * @brief JSON representation of an identifier's four stored fields.
 *
 * @details
 * The document carries the raw fields only, in declared order:
 *
 * @code
 * {"id":"7820329710005860628","parent":"0","depth":1,"gen":0}
 * @endcode
 *
 * `id` (64-bit) and `parent` (128-bit) are written as decimal strings because
 * cJSON stores numbers as doubles, which cannot hold them exactly. `depth` and
 * `gen` (32-bit) are plain numbers. The derived value is never written; it is
 * recomputed from the fields after decoding.
 */

#pragma once

#include "lineage/codec/error.hpp"
#include "lineage/core/id.hpp"

#include <string>

namespace lineage::codec {

/**
 * @class Json
 * @brief Static encoder/decoder between `core::Id` and JSON text.
 */
class Json {
  public:
    /**
     * @brief Serializes the four stored fields as compact JSON.
     *
     * @throws CodecError If cJSON fails to allocate the document.
     */
    static std::string encode(const core::Id& id);

    /**
     * @brief Parses a JSON object produced by `encode` (or a compatible writer).
     *
     * `id` and `parent` are accepted either as decimal strings or as
     * non-negative integral numbers no greater than 2^53. `depth` and `gen`
     * must be integral numbers within 32 bits. Unknown keys are ignored.
     *
     * @throws CodecError On invalid syntax, a missing key, a wrong type or an
     * out-of-range value.
     */
    static core::Id decode(const std::string& raw_json);
};

} // namespace lineage::codec
