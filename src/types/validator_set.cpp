/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "types/validator_set.hpp"

#include <algorithm>

#include "crypto/merkle.hpp"
#include "serde/serialization.hpp"
#include "types/validation_error.hpp"

namespace light {

  outcome::result<ValidatorSet> ValidatorSet::create(
      std::vector<Validator> validators) {
    std::ranges::sort(validators, std::less{}, &Validator::address);
    ValidatorSet set;
    set.validators_.data() = std::move(validators);
    OUTCOME_TRY(set.validate());
    return set;
  }

  Address ValidatorSet::addressFromPubkey(const crypto::Hasher &hasher,
                                          const PublicKey &pub_key) {
    auto digest = hasher.sha2_256(pub_key);
    Address address;
    std::copy_n(digest.begin(), address.size(), address.begin());
    return address;
  }

  outcome::result<void> ValidatorSet::validate() const {
    auto &validators = validators_.data();
    if (validators.empty()) {
      return ValidationError::EMPTY_VALIDATOR_SET;
    }
    VotingPower total = 0;
    for (size_t i = 0; i < validators.size(); ++i) {
      auto &validator = validators[i];
      if (i > 0) {
        auto &prev = validators[i - 1].address;
        if (prev == validator.address) {
          return ValidationError::DUPLICATE_VALIDATOR;
        }
        if (validator.address < prev) {
          return ValidationError::UNSORTED_VALIDATOR_SET;
        }
      }
      if (validator.voting_power == 0) {
        return ValidationError::ZERO_VOTING_POWER;
      }
      if (validator.voting_power > kMaxTotalVotingPower - total) {
        return ValidationError::TOTAL_VOTING_POWER_OVERFLOW;
      }
      total += validator.voting_power;
    }
    return outcome::success();
  }

  std::optional<size_t> ValidatorSet::indexOf(const Address &address) const {
    auto &validators = validators_.data();
    auto it = std::ranges::lower_bound(
        validators, address, std::less{}, &Validator::address);
    if (it == validators.end() or it->address != address) {
      return std::nullopt;
    }
    return static_cast<size_t>(std::distance(validators.begin(), it));
  }

  VotingPower ValidatorSet::totalVotingPower() const {
    VotingPower total = 0;
    for (auto &validator : validators_) {
      total += validator.voting_power;
    }
    return total;
  }

  VotingPower ValidatorSet::votingPowerIn(const Signers &signers) const {
    VotingPower power = 0;
    for (auto &address : signers) {
      if (auto index = indexOf(address)) {
        power += at(*index).voting_power;
      }
    }
    return power;
  }

  Hash256 ValidatorSet::hash(const crypto::Hasher &hasher) const {
    std::vector<qtils::ByteVec> leaves;
    leaves.reserve(size());
    for (auto &validator : validators_) {
      SimpleValidator simple{
          .pub_key = validator.pub_key,
          .voting_power = validator.voting_power,
      };
      leaves.emplace_back(encode(simple).value());
    }
    return crypto::merkleRoot(hasher, leaves);
  }

}  // namespace light
