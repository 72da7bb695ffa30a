/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "types/validation_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(light, ValidationError, e) {
  using E = ValidationError;
  switch (e) {
    case E::EMPTY_CHAIN_ID:
      return "Chain id is empty";
    case E::CHAIN_ID_TOO_LONG:
      return "Chain id is too long";
    case E::CHAIN_ID_MISMATCH:
      return "Header belongs to another chain";
    case E::ZERO_HEIGHT:
      return "Height must be positive";
    case E::ZERO_TIMESTAMP:
      return "Timestamp must be set";
    case E::COMMIT_HEIGHT_MISMATCH:
      return "Commit height doesn't match header height";
    case E::COMMIT_BLOCK_ID_MISMATCH:
      return "Commit signs a block other than the header";
    case E::EMPTY_COMMIT:
      return "Commit has no signatures";
    case E::EMPTY_VALIDATOR_SET:
      return "Validator set is empty";
    case E::UNSORTED_VALIDATOR_SET:
      return "Validator set is not ordered by address";
    case E::DUPLICATE_VALIDATOR:
      return "Validator set contains duplicate address";
    case E::ZERO_VOTING_POWER:
      return "Validator has zero voting power";
    case E::TOTAL_VOTING_POWER_OVERFLOW:
      return "Total voting power exceeds the maximum";
    case E::NEXT_VALIDATORS_HASH_MISMATCH:
      return "Next validator set doesn't match header next validators hash";
    case E::INVALID_TRUST_LEVEL:
      return "Trust level must be within [1/3, 1]";
    case E::INVALID_TRUSTING_PERIOD:
      return "Trusting period must be positive";
    case E::INVALID_UNBONDING_PERIOD:
      return "Unbonding period must be positive";
    case E::INVALID_MAX_CLOCK_DRIFT:
      return "Max clock drift must be positive";
    case E::TRUSTING_PERIOD_NOT_BELOW_UNBONDING:
      return "Trusting period must be less than unbonding period";
    case E::TIMESTAMP_OUT_OF_RANGE:
      return "Timestamp is too far in the future";
    case E::PERIOD_OUT_OF_RANGE:
      return "Period is too long";
  }
  return "Unknown ValidationError";
}
