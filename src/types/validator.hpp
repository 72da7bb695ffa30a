/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/types.hpp"

namespace light {

  struct Validator : ssz::ssz_container {
    Address address;
    PublicKey pub_key;
    VotingPower voting_power = 0;

    SSZ_CONT(address, pub_key, voting_power);
    bool operator==(const Validator &) const = default;
  };

  /// Part of a validator committed to by the validator-set hash
  struct SimpleValidator : ssz::ssz_container {
    PublicKey pub_key;
    VotingPower voting_power = 0;

    SSZ_CONT(pub_key, voting_power);
  };

}  // namespace light
