/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/block_header.hpp"
#include "types/commit.hpp"

namespace light {

  /**
   * @struct SignedHeader
   * Header together with the commit which finalizes it.
   */
  struct SignedHeader : ssz::ssz_variable_size_container {
    BlockHeader header;
    Commit commit;

    SSZ_CONT(header, commit);
    bool operator==(const SignedHeader &) const = default;

    Height height() const {
      return header.height;
    }

    Timestamp timestamp() const {
      return header.timestamp();
    }

    /**
     * Checks header fields and that the commit is for this very header of
     * chain `chain_id`. Signatures are not checked.
     */
    outcome::result<void> validateBasic(const ChainId &chain_id,
                                        const crypto::Hasher &hasher) const;
  };

}  // namespace light
