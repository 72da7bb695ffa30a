/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "crypto/hasher.hpp"
#include "types/block_id.hpp"
#include "types/chain_id.hpp"

namespace light {

  struct ConsensusVersion : ssz::ssz_container {
    uint64_t block = 0;
    uint64_t app = 0;

    SSZ_CONT(block, app);
    bool operator==(const ConsensusVersion &) const = default;
  };

  /**
   * @struct BlockHeader
   * Header fields of a block of the counterparty chain.
   */
  struct BlockHeader : ssz::ssz_variable_size_container {
    ConsensusVersion version;
    ChainId chain_id;
    /// Height of the block, starts from 1
    Height height = 0;
    /// Block time in nanoseconds since Unix epoch
    TimestampNs time = 0;
    /// Identifier of the previous block
    BlockId last_block_id;
    /// Merkle root of the previous block's commit
    Hash256 last_commit_hash;
    /// Merkle root of the transactions
    Hash256 data_hash;
    /// Hash of the validator set which signs this block
    Hash256 validators_hash;
    /// Hash of the validator set which signs the next block
    Hash256 next_validators_hash;
    Hash256 consensus_hash;
    /// State root after the previous block, used as commitment root
    Hash256 app_hash;
    Hash256 last_results_hash;
    Hash256 evidence_hash;
    Address proposer_address;

    SSZ_CONT(version,
             chain_id,
             height,
             time,
             last_block_id,
             last_commit_hash,
             data_hash,
             validators_hash,
             next_validators_hash,
             consensus_hash,
             app_hash,
             last_results_hash,
             evidence_hash,
             proposer_address);
    bool operator==(const BlockHeader &) const = default;

    Timestamp timestamp() const {
      return toTimestamp(time);
    }

    /// Merkle root over the encoded header fields
    Hash256 hash(const crypto::Hasher &hasher) const;

    outcome::result<void> validateBasic() const;
  };

}  // namespace light
