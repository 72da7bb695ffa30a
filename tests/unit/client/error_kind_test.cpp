/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "client/client_error.hpp"
#include "client/error_kind.hpp"
#include "serde/serialization.hpp"
#include "testutil/dummy_error.hpp"
#include "types/validation_error.hpp"
#include "verifier/verification_error.hpp"

using light::ClientError;
using light::ErrorKind;
using light::VerificationError;
using light::classifyError;

TEST(ErrorKindTest, TemporalViolations) {
  for (auto e : {ClientError::TRUSTING_PERIOD_EXPIRED,
                 ClientError::HEADER_OUTSIDE_TRUSTING_PERIOD,
                 ClientError::NON_MONOTONIC_TIMESTAMP,
                 ClientError::NON_MONOTONIC_HEIGHT}) {
    EXPECT_EQ(classifyError(make_error_code(e)),
              ErrorKind::TEMPORAL_VIOLATION);
  }
  for (auto e : {VerificationError::NON_INCREASING_HEIGHT,
                 VerificationError::NON_INCREASING_TIME,
                 VerificationError::HEADER_FROM_FUTURE,
                 VerificationError::TRUSTED_HEADER_EXPIRED}) {
    EXPECT_EQ(classifyError(make_error_code(e)),
              ErrorKind::TEMPORAL_VIOLATION);
  }
}

TEST(ErrorKindTest, CryptoFailures) {
  for (auto e : {VerificationError::INSUFFICIENT_VOTING_POWER,
                 VerificationError::INSUFFICIENT_TRUST,
                 VerificationError::VALIDATOR_SET_MISMATCH,
                 VerificationError::INVALID_SIGNATURE,
                 VerificationError::INVALID_COMMIT}) {
    EXPECT_EQ(classifyError(make_error_code(e)),
              ErrorKind::CRYPTO_VERIFICATION_FAILURE);
  }
}

TEST(ErrorKindTest, OtherKinds) {
  EXPECT_EQ(classifyError(make_error_code(VerificationError::NO_TRUST_PATH)),
            ErrorKind::PROVIDER_FAILURE);
  EXPECT_EQ(classifyError(make_error_code(ClientError::CLIENT_FROZEN)),
            ErrorKind::CLIENT_FROZEN);
  EXPECT_EQ(
      classifyError(make_error_code(light::ValidationError::EMPTY_COMMIT)),
      ErrorKind::MALFORMED_INPUT);
  EXPECT_EQ(classifyError(std::error_code{light::SszError::DecodeError}),
            ErrorKind::MALFORMED_INPUT);
  EXPECT_EQ(classifyError(std::error_code{testutil::DummyError::ERROR}),
            ErrorKind::UNKNOWN);
}

TEST(ErrorKindTest, Names) {
  EXPECT_EQ(light::toString(ErrorKind::PROVIDER_FAILURE), "provider failure");
  EXPECT_EQ(fmt::format("{}", ErrorKind::CLIENT_FROZEN), "client frozen");
}
