/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/merkle.hpp"

#include <bit>
#include <span>

namespace light::crypto {

  namespace {
    constexpr uint8_t kLeafPrefix = 0x00;
    constexpr uint8_t kInnerPrefix = 0x01;

    // Largest power of two strictly less than `n`, n > 1
    size_t splitPoint(size_t n) {
      return std::bit_floor(n - 1);
    }

    Hash256 rootOf(const Hasher &hasher,
                   std::span<const qtils::ByteVec> items) {
      if (items.size() == 1) {
        return merkleLeafHash(hasher, items.front());
      }
      auto k = splitPoint(items.size());
      auto left = rootOf(hasher, items.first(k));
      auto right = rootOf(hasher, items.subspan(k));
      return merkleInnerHash(hasher, left, right);
    }
  }  // namespace

  Hash256 merkleLeafHash(const Hasher &hasher, qtils::BytesIn leaf) {
    qtils::ByteVec buffer;
    buffer.reserve(1 + leaf.size());
    buffer.push_back(kLeafPrefix);
    buffer.insert(buffer.end(), leaf.begin(), leaf.end());
    return hasher.sha2_256(buffer);
  }

  Hash256 merkleInnerHash(const Hasher &hasher,
                          const Hash256 &left,
                          const Hash256 &right) {
    qtils::ByteVec buffer;
    buffer.reserve(1 + left.size() + right.size());
    buffer.push_back(kInnerPrefix);
    buffer.insert(buffer.end(), left.begin(), left.end());
    buffer.insert(buffer.end(), right.begin(), right.end());
    return hasher.sha2_256(buffer);
  }

  Hash256 merkleRoot(const Hasher &hasher,
                     const std::vector<qtils::ByteVec> &items) {
    if (items.empty()) {
      return hasher.sha2_256({});
    }
    return rootOf(hasher, items);
  }

}  // namespace light::crypto
