/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "crypto/hasher.hpp"
#include "log/logger.hpp"
#include "types/client_state.hpp"
#include "types/consensus_state.hpp"
#include "verifier/trust_verifier.hpp"

namespace light {

  /**
   * State transition of a light client.
   *
   * Pure with respect to the client state: the new state is returned, never
   * written in place. Cheap temporal checks run before any signature is
   * looked at.
   */
  class LightClient {
   public:
    /// Result of an accepted update
    struct Update {
      ClientState client_state;
      ConsensusState consensus_state;
    };

    LightClient(qtils::SharedRef<log::LoggingSystem> logging_system,
                qtils::SharedRef<crypto::Hasher> hasher,
                qtils::SharedRef<TrustVerifier> verifier);

    /**
     * Verifies `header` against the latest header of `client_state`.
     * @param now current time of the verifier
     * @return client state with `header` as latest one and the consensus
     * state of `header`
     */
    outcome::result<Update> applyUpdate(const ClientState &client_state,
                                        const Header &header,
                                        Timestamp now) const;

    /// Consensus state committed by an already verified header
    ConsensusState consensusStateOf(const Header &header) const;

   private:
    outcome::result<void> checkTemporal(const ClientState &client_state,
                                        const Header &header,
                                        Timestamp now) const;

    log::Logger logger_;
    qtils::SharedRef<crypto::Hasher> hasher_;
    qtils::SharedRef<TrustVerifier> verifier_;
  };

}  // namespace light
