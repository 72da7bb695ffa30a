/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "types/block_header.hpp"

#include "crypto/merkle.hpp"
#include "serde/serialization.hpp"

namespace light {

  Hash256 BlockHeader::hash(const crypto::Hasher &hasher) const {
    std::vector<qtils::ByteVec> fields;
    fields.reserve(14);
    auto push = [&](const auto &field) {
      fields.emplace_back(encode(field).value());
    };
    push(version);
    push(chain_id);
    push(height);
    push(time);
    push(last_block_id);
    push(last_commit_hash);
    push(data_hash);
    push(validators_hash);
    push(next_validators_hash);
    push(consensus_hash);
    push(app_hash);
    push(last_results_hash);
    push(evidence_hash);
    push(proposer_address);
    return crypto::merkleRoot(hasher, fields);
  }

  outcome::result<void> BlockHeader::validateBasic() const {
    OUTCOME_TRY(validateChainId(chain_id));
    if (height == 0) {
      return ValidationError::ZERO_HEIGHT;
    }
    if (time == 0) {
      return ValidationError::ZERO_TIMESTAMP;
    }
    if (time > kMaxTimestampNs) {
      return ValidationError::TIMESTAMP_OUT_OF_RANGE;
    }
    return outcome::success();
  }

}  // namespace light
