/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/types.hpp"
#include "types/validation_error.hpp"

namespace light {

  /**
   * @struct MerkleRoot
   * Commitment root against which higher layers prove application data.
   */
  struct MerkleRoot : ssz::ssz_container {
    Hash256 hash;

    SSZ_CONT(hash);
    bool operator==(const MerkleRoot &) const = default;

    /// Commitment root of a header is its app hash
    static MerkleRoot fromAppHash(const Hash256 &app_hash) {
      return MerkleRoot{.hash = app_hash};
    }
  };

  /**
   * @struct ConsensusState
   * Snapshot of a verified height. Never changed after creation.
   */
  struct ConsensusState : ssz::ssz_container {
    Height height = 0;
    TimestampNs timestamp = 0;
    MerkleRoot root;
    Hash256 next_validators_hash;

    SSZ_CONT(height, timestamp, root, next_validators_hash);
    bool operator==(const ConsensusState &) const = default;

    Timestamp time() const {
      return toTimestamp(timestamp);
    }

    outcome::result<void> validateBasic() const {
      if (height == 0) {
        return ValidationError::ZERO_HEIGHT;
      }
      if (timestamp == 0) {
        return ValidationError::ZERO_TIMESTAMP;
      }
      if (timestamp > kMaxTimestampNs) {
        return ValidationError::TIMESTAMP_OUT_OF_RANGE;
      }
      return outcome::success();
    }
  };

}  // namespace light
