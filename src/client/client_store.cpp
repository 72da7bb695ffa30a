/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/client_store.hpp"

#include "client/error_kind.hpp"
#include "types/chain_id.hpp"

namespace light {

  outcome::result<std::unique_ptr<ClientStore>> ClientStore::create(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<crypto::Hasher> hasher,
      qtils::SharedRef<LightClient> light_client,
      qtils::SharedRef<clock::SystemClock> clock,
      ClientState client_state) {
    OUTCOME_TRY(client_state.validate(*hasher));
    auto initial = light_client->consensusStateOf(client_state.latest_header);
    return std::make_unique<ClientStore>(Private{},
                                         std::move(logging_system),
                                         std::move(light_client),
                                         std::move(clock),
                                         std::move(client_state),
                                         initial);
  }

  ClientStore::ClientStore(Private,
                           qtils::SharedRef<log::LoggingSystem> logging_system,
                           qtils::SharedRef<LightClient> light_client,
                           qtils::SharedRef<clock::SystemClock> clock,
                           ClientState client_state,
                           ConsensusState initial)
      : logger_(logging_system->getLogger("ClientStore", "client")),
        light_client_(std::move(light_client)),
        clock_(std::move(clock)),
        client_state_(std::move(client_state)) {
    consensus_states_.emplace(initial.height, initial);
    SL_INFO(logger_,
            "Client of chain '{}' trusts #{}",
            chainIdToString(client_state_.chain_id),
            client_state_.latestHeight());
  }

  outcome::result<ConsensusState> ClientStore::update(const Header &header) {
    std::lock_guard lock(mutex_);
    auto res = light_client_->applyUpdate(client_state_, header, clock_->now());
    if (res.has_error()) {
      SL_WARN(logger_,
              "Update to #{} failed ({}): {}",
              header.height(),
              classifyError(res.error()),
              res.error());
      return res.error();
    }
    auto &update = res.value();
    client_state_ = std::move(update.client_state);
    consensus_states_.insert_or_assign(update.consensus_state.height,
                                       update.consensus_state);
    return update.consensus_state;
  }

  void ClientStore::freeze() {
    std::lock_guard lock(mutex_);
    if (not client_state_.frozen) {
      SL_WARN(logger_, "Client frozen at #{}", client_state_.latestHeight());
    }
    client_state_.frozen = true;
  }

  ClientState ClientStore::clientState() const {
    std::lock_guard lock(mutex_);
    return client_state_;
  }

  std::optional<ConsensusState> ClientStore::consensusState(
      Height height) const {
    std::lock_guard lock(mutex_);
    auto it = consensus_states_.find(height);
    if (it == consensus_states_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  ConsensusState ClientStore::latestConsensusState() const {
    std::lock_guard lock(mutex_);
    return consensus_states_.rbegin()->second;
  }

  Height ClientStore::latestHeight() const {
    std::lock_guard lock(mutex_);
    return client_state_.latestHeight();
  }

}  // namespace light
