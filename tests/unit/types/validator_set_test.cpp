/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "testutil/chain_builder.hpp"
#include "types/validation_error.hpp"
#include "types/validator_set.hpp"

using light::Address;
using light::ValidationError;
using light::Validator;
using light::ValidatorSet;
using testutil::ChainBuilder;

class ValidatorSetTest : public testing::Test {
 public:
  ChainBuilder chain;
  testutil::Committee committee = chain.committee(4, 1);

  std::vector<Validator> validators() const {
    std::vector<Validator> result;
    for (auto &member : committee) {
      result.push_back(member.validator);
    }
    return result;
  }
};

/**
 * @given validators in reverse address order
 * @when a validator set is created of them
 * @then validators are ordered by address
 */
TEST_F(ValidatorSetTest, CreateSortsByAddress) {
  auto input = validators();
  std::ranges::reverse(input);
  ASSERT_OUTCOME_SUCCESS(set, ValidatorSet::create(input));
  ASSERT_EQ(set.size(), 4);
  for (size_t i = 1; i < set.size(); ++i) {
    EXPECT_LT(set.at(i - 1).address, set.at(i).address);
  }
  EXPECT_EQ(set.totalVotingPower(), 40);
}

TEST_F(ValidatorSetTest, RejectsInvalidSets) {
  EXPECT_OUTCOME_ERROR(
      res, ValidatorSet::create({}), ValidationError::EMPTY_VALIDATOR_SET);

  auto duplicated = validators();
  duplicated.push_back(duplicated.front());
  EXPECT_OUTCOME_ERROR(res2,
                       ValidatorSet::create(duplicated),
                       ValidationError::DUPLICATE_VALIDATOR);

  auto zero_power = validators();
  zero_power[2].voting_power = 0;
  EXPECT_OUTCOME_ERROR(res3,
                       ValidatorSet::create(zero_power),
                       ValidationError::ZERO_VOTING_POWER);

  auto overflow = validators();
  overflow[0].voting_power = light::kMaxTotalVotingPower;
  EXPECT_OUTCOME_ERROR(res4,
                       ValidatorSet::create(overflow),
                       ValidationError::TOTAL_VOTING_POWER_OVERFLOW);
}

namespace {
  // Same wire layout as ValidatorSet, without its invariants
  struct RawValidatorSet : ssz::ssz_variable_size_container {
    ssz::list<Validator, light::MAX_VALIDATORS> validators;

    SSZ_CONT(validators);
  };
}  // namespace

/**
 * @given a set decoded from the wire with validators in wrong order
 * @when it is validated
 * @then it is rejected, while a well-formed one passes
 */
TEST_F(ValidatorSetTest, DecodedSetIsValidated) {
  ASSERT_OUTCOME_SUCCESS(set, ValidatorSet::create(validators()));
  ASSERT_OUTCOME_SUCCESS(encoded, light::encode(set));
  ASSERT_OUTCOME_SUCCESS(decoded, light::decode<ValidatorSet>(encoded));
  EXPECT_EQ(decoded, set);
  EXPECT_OUTCOME_SUCCESS(decoded.validate());

  RawValidatorSet raw;
  raw.validators.data() = set.validators();
  std::ranges::reverse(raw.validators.data());
  ASSERT_OUTCOME_SUCCESS(raw_encoded, light::encode(raw));
  ASSERT_OUTCOME_SUCCESS(unsorted, light::decode<ValidatorSet>(raw_encoded));
  EXPECT_OUTCOME_ERROR(
      res, unsorted.validate(), ValidationError::UNSORTED_VALIDATOR_SET);
}

TEST_F(ValidatorSetTest, VotingPowerInIgnoresUnknownAddresses) {
  ASSERT_OUTCOME_SUCCESS(set, ValidatorSet::create(validators()));
  auto stranger = chain.committee(1, 99).front().validator.address;

  ValidatorSet::Signers signers{set.at(0).address, set.at(3).address, stranger};
  EXPECT_EQ(set.votingPowerIn(signers), 20);
  EXPECT_EQ(set.votingPowerIn({}), 0);
  EXPECT_EQ(set.votingPowerIn({stranger}), 0);
}

TEST_F(ValidatorSetTest, IndexOf) {
  ASSERT_OUTCOME_SUCCESS(set, ValidatorSet::create(validators()));
  for (size_t i = 0; i < set.size(); ++i) {
    EXPECT_EQ(set.indexOf(set.at(i).address), i);
  }
  EXPECT_EQ(set.indexOf(Address{}), std::nullopt);
}

/**
 * @given two sets differing only in voting power of one validator
 * @when their hashes are computed
 * @then hashes differ, while equal sets hash equally
 */
TEST_F(ValidatorSetTest, HashCommitsToKeysAndPowers) {
  auto &hasher = chain.hasher();
  ASSERT_OUTCOME_SUCCESS(set, ValidatorSet::create(validators()));
  ASSERT_OUTCOME_SUCCESS(same, ValidatorSet::create(validators()));
  auto changed_input = validators();
  changed_input[1].voting_power += 1;
  ASSERT_OUTCOME_SUCCESS(changed, ValidatorSet::create(changed_input));

  EXPECT_EQ(set.hash(hasher), same.hash(hasher));
  EXPECT_NE(set.hash(hasher), changed.hash(hasher));
}

TEST_F(ValidatorSetTest, AddressIsTruncatedSha256OfPubkey) {
  auto &hasher = chain.hasher();
  auto &validator = committee.front().validator;
  auto digest = hasher.sha2_256(validator.pub_key);
  EXPECT_TRUE(std::equal(validator.address.begin(),
                         validator.address.end(),
                         digest.begin()));
}
