/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hash_types.hpp"
#include "crypto/hasher.hpp"

namespace light::crypto {

  class HasherImpl : public Hasher {
   public:
    ~HasherImpl() override = default;

    Hash256 sha2_256(qtils::BytesIn data) const override;
  };

}  // namespace light::crypto
