/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <set>
#include <vector>

#include <qtils/outcome.hpp>
#include <sszpp/lists.hpp>

#include "crypto/hasher.hpp"
#include "types/validator.hpp"

namespace light {

  /**
   * @class ValidatorSet
   * Validators of one height ordered by address.
   * Immutable: a changed committee is a new ValidatorSet value.
   */
  class ValidatorSet : public ssz::ssz_variable_size_container {
   public:
    using Signers = std::set<Address>;

    ValidatorSet() = default;

    /**
     * Orders `validators` by address and checks the set invariants
     * @see validate
     */
    static outcome::result<ValidatorSet> create(
        std::vector<Validator> validators);

    /// Address of a validator is derived from its public key
    static Address addressFromPubkey(const crypto::Hasher &hasher,
                                     const PublicKey &pub_key);

    /**
     * Checks that the set is non-empty, ordered by unique addresses, every
     * validator has positive voting power and total voting power does not
     * exceed kMaxTotalVotingPower. Sets obtained from the wire must pass it
     * before being used for verification.
     */
    outcome::result<void> validate() const;

    size_t size() const {
      return validators_.size();
    }

    const std::vector<Validator> &validators() const {
      return validators_.data();
    }

    const Validator &at(size_t index) const {
      return validators_.data().at(index);
    }

    /// Position of validator with given address
    std::optional<size_t> indexOf(const Address &address) const;

    VotingPower totalVotingPower() const;

    /**
     * Sums voting power of validators present in `signers`.
     * Addresses unknown to this set are ignored.
     */
    VotingPower votingPowerIn(const Signers &signers) const;

    /// Merkle root over validators' public keys and voting powers
    Hash256 hash(const crypto::Hasher &hasher) const;

    bool operator==(const ValidatorSet &) const = default;

    SSZ_CONT(validators_);

   private:
    ssz::list<Validator, MAX_VALIDATORS> validators_;
  };

}  // namespace light
