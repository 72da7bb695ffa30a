/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>
#include <sszpp/lists.hpp>

#include "types/block_id.hpp"

namespace light {

  /// What a validator voted for in the commit round
  enum class BlockIdFlag : uint8_t {
    ABSENT = 1,
    COMMIT = 2,
    NIL = 3,
  };

  using SignatureBytes = ssz::list<uint8_t, SIGNATURE_SIZE>;

  /**
   * @struct CommitSig
   * Signature slot of one validator. Slots are aligned positionally with the
   * validator set that produced the commit.
   */
  struct CommitSig : ssz::ssz_variable_size_container {
    uint8_t block_id_flag = static_cast<uint8_t>(BlockIdFlag::ABSENT);
    Address validator_address;
    TimestampNs timestamp = 0;
    SignatureBytes signature;

    SSZ_CONT(block_id_flag, validator_address, timestamp, signature);
    bool operator==(const CommitSig &) const = default;

    BlockIdFlag flag() const {
      return static_cast<BlockIdFlag>(block_id_flag);
    }

    bool isCommit() const {
      return flag() == BlockIdFlag::COMMIT;
    }

    static CommitSig absent() {
      return {};
    }
  };

  struct Commit : ssz::ssz_variable_size_container {
    Height height = 0;
    uint32_t round = 0;
    BlockId block_id;
    ssz::list<CommitSig, MAX_VALIDATORS> signatures;

    SSZ_CONT(height, round, block_id, signatures);
    bool operator==(const Commit &) const = default;
  };

}  // namespace light
