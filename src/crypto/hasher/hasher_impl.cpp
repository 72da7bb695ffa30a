/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <openssl/sha.h>

namespace light::crypto {

  Hash256 HasherImpl::sha2_256(qtils::BytesIn data) const {
    Hash256 out;
    SHA256(data.data(), data.size(), out.data());
    return out;
  }

}  // namespace light::crypto
