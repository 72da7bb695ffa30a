/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "crypto/hasher.hpp"
#include "log/logger.hpp"
#include "types/light_block.hpp"
#include "verifier/commit_verifier.hpp"
#include "verifier/header_provider.hpp"
#include "verifier/trust_options.hpp"

namespace light {

  /**
   * Decides whether an untrusted light block can be trusted given a trusted
   * one.
   *
   * Adjacent heights, and headers signed by the unchanged validator set, need
   * a quorum of the committed set. Otherwise the untrusted commit must be
   * signed by `trust_level` of the trusted voting power and by a quorum of
   * its own set. When the trusted power is insufficient and a header provider
   * is present, the height gap is bisected at its midpoint.
   */
  class TrustVerifier {
   public:
    TrustVerifier(qtils::SharedRef<log::LoggingSystem> logging_system,
                  qtils::SharedRef<crypto::Hasher> hasher,
                  qtils::SharedRef<CommitVerifier> commit_verifier,
                  std::shared_ptr<HeaderProvider> header_provider);

    /**
     * @param trusted light block already trusted, used as anchor
     * @param untrusted light block to be verified
     * @param options trust parameters of the client
     * @param now current time of the verifier
     */
    outcome::result<void> verify(const LightBlock &trusted,
                                 const LightBlock &untrusted,
                                 const TrustOptions &options,
                                 Timestamp now) const;

   private:
    outcome::result<void> verifyStep(const LightBlock &trusted,
                                     const LightBlock &untrusted,
                                     const TrustOptions &options,
                                     Timestamp now,
                                     size_t depth) const;

    outcome::result<void> checkTemporal(const LightBlock &trusted,
                                        const LightBlock &untrusted,
                                        const TrustOptions &options,
                                        Timestamp now) const;

    outcome::result<void> checkUntrusted(const LightBlock &trusted,
                                         const LightBlock &untrusted) const;

    outcome::result<void> verifyAdjacent(const LightBlock &trusted,
                                         const LightBlock &untrusted,
                                         const TrustOptions &options) const;

    outcome::result<void> verifySkipping(const LightBlock &trusted,
                                         const LightBlock &untrusted,
                                         const TrustOptions &options,
                                         Timestamp now,
                                         size_t depth) const;

    outcome::result<void> bisect(const LightBlock &trusted,
                                 const LightBlock &untrusted,
                                 const TrustOptions &options,
                                 Timestamp now,
                                 size_t depth) const;

    log::Logger logger_;
    qtils::SharedRef<crypto::Hasher> hasher_;
    qtils::SharedRef<CommitVerifier> commit_verifier_;
    std::shared_ptr<HeaderProvider> header_provider_;
  };

}  // namespace light
