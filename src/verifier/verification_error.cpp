/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/verification_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(light, VerificationError, e) {
  using E = VerificationError;
  switch (e) {
    case E::INSUFFICIENT_VOTING_POWER:
      return "Insufficient voting power signed the commit";
    case E::INSUFFICIENT_TRUST:
      return "Insufficient trusted voting power signed the commit";
    case E::VALIDATOR_SET_MISMATCH:
      return "Validator set doesn't match header";
    case E::INVALID_SIGNATURE:
      return "Malformed commit signature";
    case E::INVALID_COMMIT:
      return "Commit doesn't match validator set";
    case E::NO_TRUST_PATH:
      return "No trusted path of intermediate headers";
    case E::NON_INCREASING_HEIGHT:
      return "Untrusted header height is not above trusted height";
    case E::NON_INCREASING_TIME:
      return "Untrusted header time is not after trusted time";
    case E::HEADER_FROM_FUTURE:
      return "Header time is beyond allowed clock drift";
    case E::TRUSTED_HEADER_EXPIRED:
      return "Trusted header is outside of trusting period";
  }
  return "Unknown VerificationError";
}
