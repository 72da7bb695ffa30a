/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/byte_vec.hpp>

#include "crypto/hasher.hpp"

namespace light::crypto {

  /**
   * Simple Merkle tree (RFC 6962) over a list of byte strings.
   *
   * Leaves are hashed as `H(0x00 || leaf)`, inner nodes as
   * `H(0x01 || left || right)`. A list of `n` items is split at the largest
   * power of two strictly less than `n`. The root of an empty list is the
   * hash of the empty string.
   */
  Hash256 merkleRoot(const Hasher &hasher,
                     const std::vector<qtils::ByteVec> &items);

  Hash256 merkleLeafHash(const Hasher &hasher, qtils::BytesIn leaf);

  Hash256 merkleInnerHash(const Hasher &hasher,
                          const Hash256 &left,
                          const Hash256 &right);

}  // namespace light::crypto
