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
 * @file error.hpp
 * @brief Exception raised when a persisted identifier cannot be read.
 */

#pragma once

#include <stdexcept>

namespace lineage::codec {

/**
 * @class CodecError
 * @brief Malformed, truncated or out-of-range identifier record.
 */
class CodecError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

} // namespace lineage::codec
