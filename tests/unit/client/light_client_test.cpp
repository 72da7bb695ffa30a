/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "client/client_error.hpp"
#include "client/error_kind.hpp"
#include "client/light_client.hpp"
#include "crypto/ed25519/ed25519_verifier.hpp"
#include "mock/crypto/signature_verifier_mock.hpp"
#include "testutil/chain_builder.hpp"
#include "testutil/prepare_loggers.hpp"
#include "types/validation_error.hpp"
#include "verifier/verification_error.hpp"

using light::ClientError;
using light::ClientState;
using light::ErrorKind;
using light::Header;
using light::Height;
using light::LightClient;
using light::Timestamp;
using light::VerificationError;
using light::classifyError;
using light::crypto::Ed25519Verifier;
using light::crypto::SignatureVerifierMock;
using testing::_;
using testing::Invoke;
using testutil::ChainBuilder;
using testutil::Committee;
using namespace std::chrono_literals;

class LightClientTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    // Real signature checks, counted
    ON_CALL(*signature_verifier, verify(_, _, _))
        .WillByDefault(Invoke(&real_verifier, &Ed25519Verifier::verify));
  }

  Timestamp timeOf(Height height) const {
    return genesis_time + height * 10s;
  }

  Header headerAt(Height height, Timestamp time) const {
    return chain.header(height, time, validators, validators);
  }

  Header headerAt(Height height) const {
    return headerAt(height, timeOf(height));
  }

  void expectNoCrypto() {
    EXPECT_CALL(*signature_verifier, verify(_, _, _)).Times(0);
  }

  qtils::SharedRef<light::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  ChainBuilder chain;
  Committee validators = chain.committee(4, 1);
  Timestamp genesis_time{1'700'000'000s};
  light::Duration trusting_period = 14 * 24h;

  Ed25519Verifier real_verifier;
  std::shared_ptr<SignatureVerifierMock> signature_verifier =
      std::make_shared<testing::NiceMock<SignatureVerifierMock>>();

  std::shared_ptr<light::TrustVerifier> trust_verifier =
      std::make_shared<light::TrustVerifier>(
          logsys,
          chain.hasherPtr(),
          std::make_shared<light::CommitVerifier>(logsys, signature_verifier),
          nullptr);
  LightClient client{logsys, chain.hasherPtr(), trust_verifier};

  ClientState client_state =
      chain.clientState(headerAt(10), trusting_period, 10s);
  Timestamp now = timeOf(20);
};

/**
 * @given client trusting #10
 * @when adjacent #11 signed by all validators is applied
 * @then client trusts #11 and consensus state describes it
 */
TEST_F(LightClientTest, AdjacentUpdate) {
  auto header = headerAt(11);
  ASSERT_OUTCOME_SUCCESS(update, client.applyUpdate(client_state, header, now));

  EXPECT_EQ(update.consensus_state.height, 11);
  EXPECT_EQ(update.consensus_state.time(), timeOf(11));
  EXPECT_EQ(update.consensus_state.root.hash,
            header.signed_header.header.app_hash);
  EXPECT_EQ(update.consensus_state.next_validators_hash,
            header.next_validator_set.hash(chain.hasher()));
  EXPECT_EQ(update.client_state.latest_header, header);
  EXPECT_EQ(update.client_state.latestHeight(), 11);
  EXPECT_FALSE(update.client_state.frozen);
  // Input state is untouched
  EXPECT_EQ(client_state.latestHeight(), 10);
}

TEST_F(LightClientTest, AdjacentUpdateWithThreeOfFourSigners) {
  auto header = chain.header(
      11, timeOf(11), validators, validators, ChainBuilder::first(3));
  ASSERT_OUTCOME_SUCCESS(update, client.applyUpdate(client_state, header, now));
  EXPECT_EQ(update.consensus_state.height, 11);
}

/**
 * @given client trusting #10 of 3 validators with power 10
 * @when adjacent #11 signed by 2 of them is applied
 * @then exactly 2/3 of the power is enough
 */
TEST_F(LightClientTest, AdjacentUpdateWithExactlyTwoThirdsSigners) {
  auto trio = chain.committee(3, 6);
  auto state = chain.clientState(
      chain.header(10, timeOf(10), trio, trio), trusting_period, 10s);
  auto header =
      chain.header(11, timeOf(11), trio, trio, ChainBuilder::first(2));
  ASSERT_OUTCOME_SUCCESS(update, client.applyUpdate(state, header, now));
  EXPECT_EQ(update.consensus_state.height, 11);
}

TEST_F(LightClientTest, AdjacentUpdateWithoutQuorum) {
  auto header = chain.header(
      11, timeOf(11), validators, validators, ChainBuilder::first(2));
  EXPECT_OUTCOME_ERROR(res,
                       client.applyUpdate(client_state, header, now),
                       VerificationError::INSUFFICIENT_VOTING_POWER);
  EXPECT_EQ(classifyError(res.error()),
            ErrorKind::CRYPTO_VERIFICATION_FAILURE);
}

/**
 * @given a state right after an accepted update
 * @when the same header is applied again
 * @then it is rejected as a temporal violation
 */
TEST_F(LightClientTest, ReplayIsRejected) {
  auto header = headerAt(11);
  ASSERT_OUTCOME_SUCCESS(update, client.applyUpdate(client_state, header, now));
  EXPECT_OUTCOME_ERROR(res,
                       client.applyUpdate(update.client_state, header, now),
                       ClientError::NON_MONOTONIC_TIMESTAMP);
  EXPECT_EQ(classifyError(res.error()), ErrorKind::TEMPORAL_VIOLATION);
}

TEST_F(LightClientTest, FrozenClientNeverVerifies) {
  expectNoCrypto();
  client_state.frozen = true;
  EXPECT_OUTCOME_ERROR(res,
                       client.applyUpdate(client_state, headerAt(11), now),
                       ClientError::CLIENT_FROZEN);
  EXPECT_EQ(classifyError(res.error()), ErrorKind::CLIENT_FROZEN);
}

TEST_F(LightClientTest, NonIncreasingHeightRejectedBeforeCrypto) {
  expectNoCrypto();
  // later time, same height
  EXPECT_OUTCOME_ERROR(
      res1,
      client.applyUpdate(client_state, headerAt(10, timeOf(11)), now),
      ClientError::NON_MONOTONIC_HEIGHT);
  EXPECT_OUTCOME_ERROR(
      res2,
      client.applyUpdate(client_state, headerAt(9, timeOf(11)), now),
      ClientError::NON_MONOTONIC_HEIGHT);
}

TEST_F(LightClientTest, NonIncreasingTimeRejectedBeforeCrypto) {
  expectNoCrypto();
  EXPECT_OUTCOME_ERROR(
      res1,
      client.applyUpdate(client_state, headerAt(11, timeOf(10)), now),
      ClientError::NON_MONOTONIC_TIMESTAMP);
  EXPECT_OUTCOME_ERROR(
      res2,
      client.applyUpdate(client_state, headerAt(11, timeOf(9)), now),
      ClientError::NON_MONOTONIC_TIMESTAMP);
}

/**
 * @given a header whose time doesn't fit into signed nanoseconds
 * @when it is applied
 * @then it is rejected as malformed before any time arithmetic or crypto
 */
TEST_F(LightClientTest, OutOfRangeTimeRejectedBeforeCrypto) {
  expectNoCrypto();
  auto header = headerAt(11);
  header.signed_header.header.time = UINT64_MAX;
  EXPECT_OUTCOME_ERROR(res,
                       client.applyUpdate(client_state, header, now),
                       light::ValidationError::TIMESTAMP_OUT_OF_RANGE);
  EXPECT_EQ(classifyError(res.error()), ErrorKind::MALFORMED_INPUT);
}

/**
 * @given client whose latest header is #10 at time T
 * @when header with time exactly T + trusting period is applied
 * @then it is rejected, and one nanosecond earlier it is accepted
 */
TEST_F(LightClientTest, TrustingPeriodBoundary) {
  auto latest_time = timeOf(10);

  auto just_inside = latest_time + trusting_period - 1ns;

  auto at_boundary = headerAt(11, latest_time + trusting_period);
  {
    expectNoCrypto();
    EXPECT_OUTCOME_ERROR(
        res,
        client.applyUpdate(client_state, at_boundary, just_inside),
        ClientError::HEADER_OUTSIDE_TRUSTING_PERIOD);
    testing::Mock::VerifyAndClearExpectations(signature_verifier.get());
  }
  ON_CALL(*signature_verifier, verify(_, _, _))
      .WillByDefault(Invoke(&real_verifier, &Ed25519Verifier::verify));

  auto inside = headerAt(11, just_inside);
  ASSERT_OUTCOME_SUCCESS(update,
                         client.applyUpdate(client_state, inside, just_inside));
  EXPECT_EQ(update.consensus_state.timestamp,
            light::toTimestampNs(just_inside));
}

TEST_F(LightClientTest, ExpiredClient) {
  expectNoCrypto();
  auto expired_now = timeOf(10) + trusting_period;
  EXPECT_OUTCOME_ERROR(
      res,
      client.applyUpdate(client_state, headerAt(11), expired_now),
      ClientError::TRUSTING_PERIOD_EXPIRED);
}

/**
 * @given a header whose own signatures are valid but whose validator set is
 * replaced by another one
 * @when it is applied
 * @then it is rejected
 */
TEST_F(LightClientTest, ValidatorSetHashMismatch) {
  auto header = headerAt(11);
  header.validator_set = chain.validatorSet(chain.committee(4, 5));
  EXPECT_OUTCOME_ERROR(res,
                       client.applyUpdate(client_state, header, now),
                       VerificationError::VALIDATOR_SET_MISMATCH);
  EXPECT_EQ(classifyError(res.error()),
            ErrorKind::CRYPTO_VERIFICATION_FAILURE);
}

TEST_F(LightClientTest, MalformedHeader) {
  auto header = headerAt(11);
  header.next_validator_set = chain.validatorSet(chain.committee(4, 5));
  EXPECT_OUTCOME_ERROR(res,
                       client.applyUpdate(client_state, header, now),
                       light::ValidationError::NEXT_VALIDATORS_HASH_MISMATCH);
  EXPECT_EQ(classifyError(res.error()), ErrorKind::MALFORMED_INPUT);
}

/**
 * @given a non-adjacent header signed by a rotated validator set
 * @when it is applied without a header provider
 * @then it fails as a crypto failure: trusted power didn't sign it
 */
TEST_F(LightClientTest, SkippingUpdateWithRotatedSet) {
  auto rotated = chain.committee(4, 2);
  auto header = chain.header(15, timeOf(15), rotated, rotated);
  EXPECT_OUTCOME_ERROR(res,
                       client.applyUpdate(client_state, header, now),
                       VerificationError::INSUFFICIENT_TRUST);
  EXPECT_EQ(classifyError(res.error()),
            ErrorKind::CRYPTO_VERIFICATION_FAILURE);
}

TEST_F(LightClientTest, SkippingUpdateWithSameSet) {
  ASSERT_OUTCOME_SUCCESS(update,
                         client.applyUpdate(client_state, headerAt(15), now));
  EXPECT_EQ(update.client_state.latestHeight(), 15);
}
