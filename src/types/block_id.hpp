/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/types.hpp"

namespace light {

  struct PartSetHeader : ssz::ssz_container {
    uint32_t total = 0;
    Hash256 hash;

    SSZ_CONT(total, hash);
    bool operator==(const PartSetHeader &) const = default;
  };

  /// Identifier of a committed block
  struct BlockId : ssz::ssz_container {
    Hash256 hash;
    PartSetHeader part_set_header;

    SSZ_CONT(hash, part_set_header);
    bool operator==(const BlockId &) const = default;
  };

}  // namespace light
