/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace light {

  enum class VerificationError : uint8_t {
    /// Valid signatures hold less than 2/3 of the voting power
    INSUFFICIENT_VOTING_POWER = 1,
    /// Valid signatures hold less than trust level of trusted power
    INSUFFICIENT_TRUST,
    VALIDATOR_SET_MISMATCH,
    INVALID_SIGNATURE,
    INVALID_COMMIT,
    NO_TRUST_PATH,
    NON_INCREASING_HEIGHT,
    NON_INCREASING_TIME,
    HEADER_FROM_FUTURE,
    TRUSTED_HEADER_EXPIRED,
  };

}  // namespace light

OUTCOME_HPP_DECLARE_ERROR(light, VerificationError);
