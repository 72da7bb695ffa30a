/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "crypto/signature_verifier.hpp"
#include "log/logger.hpp"
#include "types/chain_id.hpp"
#include "types/commit.hpp"
#include "types/fraction.hpp"
#include "types/validator_set.hpp"

namespace light {

  /**
   * Voting power of valid signatures found in a commit
   */
  struct Tally {
    VotingPower signed_power = 0;
    VotingPower total_power = 0;
    /// Whether the required threshold is reached
    bool reached = false;
  };

  /**
   * Checks commit signatures against a validator set.
   *
   * A COMMIT slot with a signature which does not verify, or whose address
   * differs from the validator it is aligned with, contributes no voting
   * power. Malformed signature encoding fails the whole commit.
   */
  class CommitVerifier {
   public:
    CommitVerifier(qtils::SharedRef<log::LoggingSystem> logging_system,
                   qtils::SharedRef<crypto::SignatureVerifier> verifier);

    /**
     * Positional check: slot `i` of `commit` belongs to validator `i` of
     * `validator_set`. Threshold is 2/3 of total voting power.
     */
    outcome::result<Tally> hasQuorum(const ChainId &chain_id,
                                     const Commit &commit,
                                     const ValidatorSet &validator_set) const;

    /**
     * Lookup by address: signers are searched in `validator_set`, unknown
     * ones are ignored. Threshold is `trust_level` of total voting power.
     */
    outcome::result<Tally> hasTrustLevel(const ChainId &chain_id,
                                         const Commit &commit,
                                         const ValidatorSet &validator_set,
                                         const Fraction &trust_level) const;

    /// Fails with INSUFFICIENT_VOTING_POWER when quorum isn't reached
    outcome::result<Tally> verifyQuorum(
        const ChainId &chain_id,
        const Commit &commit,
        const ValidatorSet &validator_set) const;

    /// Fails with INSUFFICIENT_TRUST when trust level isn't reached
    outcome::result<Tally> verifyTrustLevel(
        const ChainId &chain_id,
        const Commit &commit,
        const ValidatorSet &validator_set,
        const Fraction &trust_level) const;

   private:
    outcome::result<bool> verifySlot(const ChainId &chain_id,
                                     const Commit &commit,
                                     size_t index,
                                     const Validator &validator) const;

    log::Logger logger_;
    qtils::SharedRef<crypto::SignatureVerifier> verifier_;
  };

}  // namespace light
