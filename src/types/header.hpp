/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/light_block.hpp"

namespace light {

  /**
   * @struct Header
   * Update payload of the client: a signed header of the counterparty chain,
   * the validator set which signed it and the validator set announced for the
   * next height.
   */
  struct Header : ssz::ssz_variable_size_container {
    SignedHeader signed_header;
    ValidatorSet validator_set;
    ValidatorSet next_validator_set;

    SSZ_CONT(signed_header, validator_set, next_validator_set);
    bool operator==(const Header &) const = default;

    Height height() const {
      return signed_header.height();
    }

    Timestamp timestamp() const {
      return signed_header.timestamp();
    }

    LightBlock lightBlock() const {
      return LightBlock{
          .signed_header = signed_header,
          .validator_set = validator_set,
      };
    }

    /**
     * Structural checks of the whole payload, including that
     * `next_validator_set` is the one announced by the header.
     * Signatures are not checked.
     */
    outcome::result<void> validateBasic(const ChainId &chain_id,
                                        const crypto::Hasher &hasher) const;
  };

}  // namespace light
