/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/commit_verifier.hpp"

#include "types/vote.hpp"
#include "utils/voting_power.hpp"
#include "verifier/verification_error.hpp"

namespace light {

  CommitVerifier::CommitVerifier(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<crypto::SignatureVerifier> verifier)
      : logger_(logging_system->getLogger("CommitVerifier", "verifier")),
        verifier_(std::move(verifier)) {}

  outcome::result<bool> CommitVerifier::verifySlot(
      const ChainId &chain_id,
      const Commit &commit,
      size_t index,
      const Validator &validator) const {
    auto &sig = commit.signatures.data().at(index);
    if (sig.signature.size() != SIGNATURE_SIZE) {
      SL_WARN(logger_,
              "Malformed signature of validator {:0x} in commit #{}",
              validator.address,
              commit.height);
      return VerificationError::INVALID_SIGNATURE;
    }
    auto message = voteSignBytes(chain_id, commit, index);
    if (not verifier_->verify(
            validator.pub_key, message, sig.signature.data())) {
      SL_DEBUG(logger_,
               "Invalid signature of validator {:0x} in commit #{}",
               validator.address,
               commit.height);
      return false;
    }
    return true;
  }

  outcome::result<Tally> CommitVerifier::hasQuorum(
      const ChainId &chain_id,
      const Commit &commit,
      const ValidatorSet &validator_set) const {
    auto &signatures = commit.signatures.data();
    if (signatures.size() != validator_set.size()) {
      SL_WARN(logger_,
              "Commit #{} has {} signatures for {} validators",
              commit.height,
              signatures.size(),
              validator_set.size());
      return VerificationError::INVALID_COMMIT;
    }

    Tally tally{.total_power = validator_set.totalVotingPower()};
    for (size_t i = 0; i < signatures.size(); ++i) {
      auto &sig = signatures[i];
      if (not sig.isCommit()) {
        continue;
      }
      auto &validator = validator_set.at(i);
      if (sig.validator_address != validator.address) {
        SL_DEBUG(logger_,
                 "Signature slot {} of commit #{} is not aligned with "
                 "validator {:0x}",
                 i,
                 commit.height,
                 validator.address);
        continue;
      }
      OUTCOME_TRY(valid, verifySlot(chain_id, commit, i, validator));
      if (valid) {
        tally.signed_power += validator.voting_power;
      }
    }
    tally.reached = reachesTwoThirds(tally.signed_power, tally.total_power);
    return tally;
  }

  outcome::result<Tally> CommitVerifier::hasTrustLevel(
      const ChainId &chain_id,
      const Commit &commit,
      const ValidatorSet &validator_set,
      const Fraction &trust_level) const {
    ValidatorSet::Signers seen;
    ValidatorSet::Signers signers;
    auto &signatures = commit.signatures.data();
    for (size_t i = 0; i < signatures.size(); ++i) {
      auto &sig = signatures[i];
      if (not sig.isCommit()) {
        continue;
      }
      auto index = validator_set.indexOf(sig.validator_address);
      if (not index.has_value()) {
        continue;
      }
      if (not seen.insert(sig.validator_address).second) {
        SL_WARN(logger_,
                "Validator {:0x} signed commit #{} twice",
                sig.validator_address,
                commit.height);
        return VerificationError::INVALID_COMMIT;
      }
      OUTCOME_TRY(valid,
                  verifySlot(chain_id, commit, i, validator_set.at(*index)));
      if (valid) {
        signers.insert(sig.validator_address);
      }
    }

    Tally tally{
        .signed_power = validator_set.votingPowerIn(signers),
        .total_power = validator_set.totalVotingPower(),
    };
    tally.reached =
        reachesFraction(tally.signed_power, tally.total_power, trust_level);
    return tally;
  }

  outcome::result<Tally> CommitVerifier::verifyQuorum(
      const ChainId &chain_id,
      const Commit &commit,
      const ValidatorSet &validator_set) const {
    OUTCOME_TRY(tally, hasQuorum(chain_id, commit, validator_set));
    if (not tally.reached) {
      SL_DEBUG(logger_,
               "Commit #{} is signed by {} of {} voting power, quorum not "
               "reached",
               commit.height,
               tally.signed_power,
               tally.total_power);
      return VerificationError::INSUFFICIENT_VOTING_POWER;
    }
    return tally;
  }

  outcome::result<Tally> CommitVerifier::verifyTrustLevel(
      const ChainId &chain_id,
      const Commit &commit,
      const ValidatorSet &validator_set,
      const Fraction &trust_level) const {
    OUTCOME_TRY(tally,
                hasTrustLevel(chain_id, commit, validator_set, trust_level));
    if (not tally.reached) {
      SL_DEBUG(logger_,
               "Commit #{} is signed by {} of {} trusted voting power, trust "
               "level {} not reached",
               commit.height,
               tally.signed_power,
               tally.total_power,
               trust_level);
      return VerificationError::INSUFFICIENT_TRUST;
    }
    return tally;
  }

}  // namespace light
