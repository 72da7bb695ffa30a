/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/signed_header.hpp"
#include "types/validator_set.hpp"

namespace light {

  /**
   * @struct LightBlock
   * Signed header with the validator set that signed it.
   * Unit of trust handled by the verifier.
   */
  struct LightBlock : ssz::ssz_variable_size_container {
    SignedHeader signed_header;
    ValidatorSet validator_set;

    SSZ_CONT(signed_header, validator_set);
    bool operator==(const LightBlock &) const = default;

    Height height() const {
      return signed_header.height();
    }

    Timestamp timestamp() const {
      return signed_header.timestamp();
    }

    const BlockHeader &header() const {
      return signed_header.header;
    }
  };

}  // namespace light
