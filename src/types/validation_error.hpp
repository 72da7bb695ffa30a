/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace light {

  /// Structural errors of decoded values, detected without any crypto
  enum class ValidationError : uint8_t {
    EMPTY_CHAIN_ID = 1,
    CHAIN_ID_TOO_LONG,
    CHAIN_ID_MISMATCH,
    ZERO_HEIGHT,
    ZERO_TIMESTAMP,
    COMMIT_HEIGHT_MISMATCH,
    COMMIT_BLOCK_ID_MISMATCH,
    EMPTY_COMMIT,
    EMPTY_VALIDATOR_SET,
    UNSORTED_VALIDATOR_SET,
    DUPLICATE_VALIDATOR,
    ZERO_VOTING_POWER,
    TOTAL_VOTING_POWER_OVERFLOW,
    NEXT_VALIDATORS_HASH_MISMATCH,
    INVALID_TRUST_LEVEL,
    INVALID_TRUSTING_PERIOD,
    INVALID_UNBONDING_PERIOD,
    INVALID_MAX_CLOCK_DRIFT,
    TRUSTING_PERIOD_NOT_BELOW_UNBONDING,
    TIMESTAMP_OUT_OF_RANGE,
    PERIOD_OUT_OF_RANGE,
  };

}  // namespace light

OUTCOME_HPP_DECLARE_ERROR(light, ValidationError);
