/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/trust_verifier.hpp"

#include <fmt/chrono.h>

#include "log/formatters/light_block_ref.hpp"
#include "types/validation_error.hpp"
#include "verifier/verification_error.hpp"

namespace light {

  TrustVerifier::TrustVerifier(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<crypto::Hasher> hasher,
      qtils::SharedRef<CommitVerifier> commit_verifier,
      std::shared_ptr<HeaderProvider> header_provider)
      : logger_(logging_system->getLogger("TrustVerifier", "verifier")),
        hasher_(std::move(hasher)),
        commit_verifier_(std::move(commit_verifier)),
        header_provider_(std::move(header_provider)) {}

  outcome::result<void> TrustVerifier::verify(const LightBlock &trusted,
                                              const LightBlock &untrusted,
                                              const TrustOptions &options,
                                              Timestamp now) const {
    return verifyStep(trusted, untrusted, options, now, 0);
  }

  outcome::result<void> TrustVerifier::verifyStep(const LightBlock &trusted,
                                                  const LightBlock &untrusted,
                                                  const TrustOptions &options,
                                                  Timestamp now,
                                                  size_t depth) const {
    OUTCOME_TRY(checkTemporal(trusted, untrusted, options, now));
    OUTCOME_TRY(checkUntrusted(trusted, untrusted));

    if (untrusted.height() == trusted.height() + 1
        or untrusted.validator_set == trusted.validator_set) {
      return verifyAdjacent(trusted, untrusted, options);
    }
    return verifySkipping(trusted, untrusted, options, now, depth);
  }

  outcome::result<void> TrustVerifier::checkTemporal(
      const LightBlock &trusted,
      const LightBlock &untrusted,
      const TrustOptions &options,
      Timestamp now) const {
    if (untrusted.header().time > kMaxTimestampNs) {
      SL_DEBUG(logger_,
               "Header #{} has out of range time {}",
               untrusted.height(),
               untrusted.header().time);
      return ValidationError::TIMESTAMP_OUT_OF_RANGE;
    }
    if (untrusted.height() <= trusted.height()) {
      SL_DEBUG(logger_,
               "Header #{} is not above trusted #{}",
               untrusted.height(),
               trusted.height());
      return VerificationError::NON_INCREASING_HEIGHT;
    }
    if (untrusted.timestamp() <= trusted.timestamp()) {
      SL_DEBUG(logger_,
               "Header #{} is not after trusted #{} in time",
               untrusted.height(),
               trusted.height());
      return VerificationError::NON_INCREASING_TIME;
    }
    if (untrusted.timestamp() >= now + options.max_clock_drift) {
      SL_DEBUG(logger_,
               "Header #{} is {} ahead of local clock",
               untrusted.height(),
               untrusted.timestamp() - now);
      return VerificationError::HEADER_FROM_FUTURE;
    }
    if (trusted.timestamp() + options.trusting_period <= now) {
      SL_DEBUG(logger_,
               "Trusted header #{} has expired",
               trusted.height());
      return VerificationError::TRUSTED_HEADER_EXPIRED;
    }
    return outcome::success();
  }

  outcome::result<void> TrustVerifier::checkUntrusted(
      const LightBlock &trusted, const LightBlock &untrusted) const {
    auto &chain_id = trusted.header().chain_id;
    OUTCOME_TRY(untrusted.signed_header.validateBasic(chain_id, *hasher_));
    OUTCOME_TRY(untrusted.validator_set.validate());
    if (untrusted.validator_set.hash(*hasher_)
        != untrusted.header().validators_hash) {
      SL_WARN(logger_,
              "Validator set doesn't match header #{}, possible attack",
              untrusted.height());
      return VerificationError::VALIDATOR_SET_MISMATCH;
    }
    return outcome::success();
  }

  outcome::result<void> TrustVerifier::verifyAdjacent(
      const LightBlock &trusted,
      const LightBlock &untrusted,
      const TrustOptions &options) const {
    auto &chain_id = trusted.header().chain_id;
    auto &commit = untrusted.signed_header.commit;

    // Next height may be signed only by the set announced by trusted header
    if (untrusted.height() == trusted.height() + 1
        and untrusted.header().validators_hash
                != trusted.header().next_validators_hash) {
      SL_WARN(logger_,
              "Header #{} is signed by validator set not announced by "
              "trusted #{}, possible attack",
              untrusted.height(),
              trusted.height());
      return VerificationError::VALIDATOR_SET_MISMATCH;
    }

    auto quorum =
        commit_verifier_->verifyQuorum(chain_id, commit, untrusted.validator_set);
    if (quorum.has_error()) {
      SL_WARN(logger_,
              "Commit of header #{} failed adjacent verification, possible "
              "attack: {}",
              untrusted.height(),
              quorum.error());
      return quorum.error();
    }
    auto trust = commit_verifier_->verifyTrustLevel(
        chain_id, commit, untrusted.validator_set, options.trust_level);
    if (trust.has_error()) {
      SL_WARN(logger_,
              "Commit of header #{} is below trust level {}, possible attack",
              untrusted.height(),
              options.trust_level);
      return trust.error();
    }
    return outcome::success();
  }

  outcome::result<void> TrustVerifier::verifySkipping(
      const LightBlock &trusted,
      const LightBlock &untrusted,
      const TrustOptions &options,
      Timestamp now,
      size_t depth) const {
    auto &chain_id = trusted.header().chain_id;
    auto &commit = untrusted.signed_header.commit;

    auto trust = commit_verifier_->verifyTrustLevel(
        chain_id, commit, trusted.validator_set, options.trust_level);
    if (trust.has_error()) {
      if (trust.error() == VerificationError::INSUFFICIENT_TRUST
          and header_provider_ != nullptr) {
        SL_DEBUG(logger_,
                 "Not enough trusted power signed #{}, bisecting from #{}",
                 untrusted.height(),
                 trusted.height());
        return bisect(trusted, untrusted, options, now, depth);
      }
      SL_WARN(logger_,
              "Commit of header #{} failed trusting verification against "
              "#{}, possible attack: {}",
              untrusted.height(),
              trusted.height(),
              trust.error());
      return trust.error();
    }

    auto quorum =
        commit_verifier_->verifyQuorum(chain_id, commit, untrusted.validator_set);
    if (quorum.has_error()) {
      SL_WARN(logger_,
              "Commit of header #{} has no quorum of its own validator set, "
              "possible attack: {}",
              untrusted.height(),
              quorum.error());
      return quorum.error();
    }
    return outcome::success();
  }

  outcome::result<void> TrustVerifier::bisect(const LightBlock &trusted,
                                              const LightBlock &untrusted,
                                              const TrustOptions &options,
                                              Timestamp now,
                                              size_t depth) const {
    if (depth >= kMaxBisectionDepth) {
      SL_WARN(logger_,
              "Bisection from #{} to #{} exceeded depth {}",
              trusted.height(),
              untrusted.height(),
              kMaxBisectionDepth);
      return VerificationError::NO_TRUST_PATH;
    }

    auto pivot_height =
        trusted.height() + (untrusted.height() - trusted.height()) / 2;
    auto pivot_res = header_provider_->lightBlock(pivot_height);
    if (pivot_res.has_error()) {
      SL_WARN(logger_,
              "Header provider failed to supply #{}: {}",
              pivot_height,
              pivot_res.error());
      return VerificationError::NO_TRUST_PATH;
    }
    auto &pivot = pivot_res.value();
    if (pivot.height() != pivot_height) {
      SL_WARN(logger_,
              "Header provider supplied #{} instead of #{}",
              pivot.height(),
              pivot_height);
      return VerificationError::NO_TRUST_PATH;
    }

    SL_TRACE(logger_,
             "Bisection pivot {} between #{} and #{}",
             LightBlockRef{pivot.height(), pivot.header().hash(*hasher_)},
             trusted.height(),
             untrusted.height());

    OUTCOME_TRY(verifyStep(trusted, pivot, options, now, depth + 1));
    return verifyStep(pivot, untrusted, options, now, depth + 1);
  }

}  // namespace light
