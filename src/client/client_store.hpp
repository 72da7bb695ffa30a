/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "client/light_client.hpp"
#include "clock/clock.hpp"

namespace light {

  /**
   * Holder of one counterparty's client state and its consensus states.
   *
   * Updates are serialized: each one reads the latest header and commits the
   * result under the same lock, so an update either fully applies or leaves
   * the store untouched.
   */
  class ClientStore {
    struct Private {};

   public:
    /**
     * Validates `client_state` and seeds history with the consensus state of
     * its latest header
     */
    static outcome::result<std::unique_ptr<ClientStore>> create(
        qtils::SharedRef<log::LoggingSystem> logging_system,
        qtils::SharedRef<crypto::Hasher> hasher,
        qtils::SharedRef<LightClient> light_client,
        qtils::SharedRef<clock::SystemClock> clock,
        ClientState client_state);

    /// Verifies `header` and makes it the latest trusted one
    outcome::result<ConsensusState> update(const Header &header);

    /// Rejects all further updates
    void freeze();

    /// Use `create`, it validates the client state first
    ClientStore(Private,
                qtils::SharedRef<log::LoggingSystem> logging_system,
                qtils::SharedRef<LightClient> light_client,
                qtils::SharedRef<clock::SystemClock> clock,
                ClientState client_state,
                ConsensusState initial);

    ClientState clientState() const;

    std::optional<ConsensusState> consensusState(Height height) const;

    ConsensusState latestConsensusState() const;

    Height latestHeight() const;

   private:
    log::Logger logger_;
    qtils::SharedRef<LightClient> light_client_;
    qtils::SharedRef<clock::SystemClock> clock_;

    mutable std::mutex mutex_;
    ClientState client_state_;
    std::map<Height, ConsensusState> consensus_states_;
  };

}  // namespace light
