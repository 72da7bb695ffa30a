/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "types/vote.hpp"

#include "serde/serialization.hpp"

namespace light {

  qtils::ByteVec voteSignBytes(const ChainId &chain_id,
                               const Commit &commit,
                               size_t index) {
    auto &sig = commit.signatures.data().at(index);
    CanonicalVote vote{
        .height = commit.height,
        .round = commit.round,
        .block_id = commit.block_id,
        .timestamp = sig.timestamp,
        .chain_id = chain_id,
    };
    return encode(vote).value();
  }

}  // namespace light
