/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "types/header.hpp"

namespace light {

  outcome::result<void> Header::validateBasic(
      const ChainId &chain_id, const crypto::Hasher &hasher) const {
    OUTCOME_TRY(signed_header.validateBasic(chain_id, hasher));
    OUTCOME_TRY(validator_set.validate());
    OUTCOME_TRY(next_validator_set.validate());
    if (next_validator_set.hash(hasher)
        != signed_header.header.next_validators_hash) {
      return ValidationError::NEXT_VALIDATORS_HASH_MISMATCH;
    }
    return outcome::success();
  }

}  // namespace light
