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
 * @file json.cpp
 * @brief cJSON-backed implementation of the identifier JSON codec.
 */

#include "lineage/codec/json.hpp"

#include "lineage/infra/logger.hpp"
#include "lineage/infra/string.hpp"

#include <cJSON.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>

namespace lineage::codec {

namespace {

struct JsonDeleter {
    void operator()(cJSON* item) const { cJSON_Delete(item); }
};

struct TextDeleter {
    void operator()(char* text) const { cJSON_free(text); }
};

using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;
using TextPtr = std::unique_ptr<char, TextDeleter>;

/// Largest integer a double represents exactly (2^53).
constexpr double MAX_EXACT_DOUBLE = 9007199254740992.0;

const cJSON* require(const cJSON* root, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!item) {
        throw CodecError(std::string("Missing field '") + key + "'");
    }
    return item;
}

/**
 * @brief Reads a wide unsigned field stored as a decimal string or small number.
 */
u128 read_wide(const cJSON* root, const char* key, u128 max)
{
    const cJSON* item = require(root, key);
    u128 value = 0;

    if (cJSON_IsString(item) && item->valuestring) {
        try {
            value = infra::String::parse_u128(item->valuestring);
        } catch (const std::exception& e) {
            throw CodecError(std::string("Field '") + key + "': " + e.what());
        }
    } else if (cJSON_IsNumber(item)) {
        double d = item->valuedouble;
        if (d < 0 || d > MAX_EXACT_DOUBLE || std::floor(d) != d) {
            throw CodecError(std::string("Field '") + key +
                             "' is not an exact non-negative integer");
        }
        value = static_cast<u128>(static_cast<uint64_t>(d));
    } else {
        throw CodecError(std::string("Field '") + key + "' must be a string or number");
    }

    if (value > max) {
        throw CodecError(std::string("Field '") + key + "' is out of range");
    }
    return value;
}

uint32_t read_u32(const cJSON* root, const char* key)
{
    const cJSON* item = require(root, key);
    if (!cJSON_IsNumber(item)) {
        throw CodecError(std::string("Field '") + key + "' must be a number");
    }

    double d = item->valuedouble;
    if (d < 0 || d > static_cast<double>(std::numeric_limits<uint32_t>::max()) ||
        std::floor(d) != d) {
        throw CodecError(std::string("Field '") + key + "' is not a 32-bit unsigned integer");
    }
    return static_cast<uint32_t>(d);
}

} // namespace

std::string Json::encode(const core::Id& id)
{
    JsonPtr root(cJSON_CreateObject());
    if (!root) {
        throw CodecError("cJSON: allocation failed");
    }

    // Insertion order is the declared field order.
    bool ok =
        cJSON_AddStringToObject(root.get(), "id", infra::String::to_decimal(id.local()).c_str()) &&
        cJSON_AddStringToObject(root.get(), "parent",
                                infra::String::to_decimal(id.parent_value()).c_str()) &&
        cJSON_AddNumberToObject(root.get(), "depth", static_cast<double>(id.depth())) &&
        cJSON_AddNumberToObject(root.get(), "gen", static_cast<double>(id.num_children()));
    if (!ok) {
        throw CodecError("cJSON: allocation failed");
    }

    TextPtr text(cJSON_PrintUnformatted(root.get()));
    if (!text) {
        throw CodecError("cJSON: print failed");
    }
    return std::string(text.get());
}

/**
 * @brief Rebuilds an identifier from its JSON form.
 *
 * Implementation Strategy:
 * 1. **Ingest**: Parse with cJSON; anything other than an object is rejected.
 * 2. **Extract**: Read each field with its width-specific range check.
 * 3. **Assemble**: Hand the raw fields to `Id::from_parts`; no derivation runs.
 */
core::Id Json::decode(const std::string& raw_json)
{
    if (raw_json.empty()) {
        throw CodecError("Empty identifier payload");
    }

    JsonPtr root(cJSON_Parse(raw_json.c_str()));
    if (!root) {
        throw CodecError("Invalid JSON syntax");
    }
    if (!cJSON_IsObject(root.get())) {
        throw CodecError("Identifier payload must be a JSON object");
    }

    const u128 local = read_wide(root.get(), "id", std::numeric_limits<uint64_t>::max());
    const u128 parent = read_wide(root.get(), "parent", ~static_cast<u128>(0));
    const uint32_t depth = read_u32(root.get(), "depth");
    const uint32_t gen = read_u32(root.get(), "gen");

    infra::Logger::log(infra::LogLevel::TRACE,
                       "Codec: decoded JSON identifier at depth " + std::to_string(depth));

    return core::Id::from_parts(static_cast<uint64_t>(local), parent, depth, gen);
}

} // namespace lineage::codec
