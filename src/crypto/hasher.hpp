/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/bytes.hpp>

#include "crypto/hash_types.hpp"

namespace light::crypto {

  /**
   * Digest used by the counterparty chain for header and validator-set
   * commitments. Must be bit-exact with the chain's own consensus.
   */
  class Hasher {
   public:
    virtual ~Hasher() = default;

    /**
     * @brief sha2_256 function calculates 32-byte sha2-256 hash
     * @param data source value
     * @return 256-bit hash value
     */
    virtual Hash256 sha2_256(qtils::BytesIn data) const = 0;
  };
}  // namespace light::crypto
