/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <sszpp/container.hpp>

#include "types/chain_id.hpp"
#include "types/commit.hpp"

namespace light {

  /**
   * @struct CanonicalVote
   * Precommit as it is signed by a validator.
   */
  struct CanonicalVote : ssz::ssz_variable_size_container {
    uint8_t type = PRECOMMIT_TYPE;
    Height height = 0;
    uint64_t round = 0;
    BlockId block_id;
    TimestampNs timestamp = 0;
    ChainId chain_id;

    SSZ_CONT(type, height, round, block_id, timestamp, chain_id);
  };

  /**
   * Bytes signed by the validator of slot `index` of `commit`
   */
  qtils::ByteVec voteSignBytes(const ChainId &chain_id,
                               const Commit &commit,
                               size_t index);

}  // namespace light
