/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "types/signed_header.hpp"

namespace light {

  outcome::result<void> SignedHeader::validateBasic(
      const ChainId &chain_id, const crypto::Hasher &hasher) const {
    OUTCOME_TRY(header.validateBasic());
    if (header.chain_id != chain_id) {
      return ValidationError::CHAIN_ID_MISMATCH;
    }
    if (commit.height != header.height) {
      return ValidationError::COMMIT_HEIGHT_MISMATCH;
    }
    if (commit.block_id.hash != header.hash(hasher)) {
      return ValidationError::COMMIT_BLOCK_ID_MISMATCH;
    }
    if (commit.signatures.size() == 0) {
      return ValidationError::EMPTY_COMMIT;
    }
    return outcome::success();
  }

}  // namespace light
