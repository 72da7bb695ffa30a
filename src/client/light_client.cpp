/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/light_client.hpp"

#include "client/client_error.hpp"
#include "client/error_kind.hpp"
#include "log/formatters/light_block_ref.hpp"
#include "types/validation_error.hpp"

namespace light {

  LightClient::LightClient(qtils::SharedRef<log::LoggingSystem> logging_system,
                           qtils::SharedRef<crypto::Hasher> hasher,
                           qtils::SharedRef<TrustVerifier> verifier)
      : logger_(logging_system->getLogger("LightClient", "client")),
        hasher_(std::move(hasher)),
        verifier_(std::move(verifier)) {}

  outcome::result<void> LightClient::checkTemporal(
      const ClientState &client_state,
      const Header &header,
      Timestamp now) const {
    // Keeps the time arithmetic below within range
    if (header.signed_header.header.time > kMaxTimestampNs) {
      SL_DEBUG(logger_,
               "Header #{} has out of range time {}",
               header.height(),
               header.signed_header.header.time);
      return ValidationError::TIMESTAMP_OUT_OF_RANGE;
    }

    auto latest_time = client_state.latestTimestamp();
    auto trusting_period = client_state.trustingPeriod();

    if (now - latest_time >= trusting_period) {
      SL_DEBUG(logger_,
               "Latest header #{} has expired",
               client_state.latestHeight());
      return ClientError::TRUSTING_PERIOD_EXPIRED;
    }
    if (header.timestamp() - latest_time >= trusting_period) {
      SL_DEBUG(logger_,
               "Header #{} is beyond trusting period of latest header #{}",
               header.height(),
               client_state.latestHeight());
      return ClientError::HEADER_OUTSIDE_TRUSTING_PERIOD;
    }
    if (header.timestamp() <= latest_time) {
      SL_DEBUG(logger_,
               "Header #{} is not after latest header #{} in time",
               header.height(),
               client_state.latestHeight());
      return ClientError::NON_MONOTONIC_TIMESTAMP;
    }
    if (header.height() <= client_state.latestHeight()) {
      SL_DEBUG(logger_,
               "Header #{} is not above latest header #{}",
               header.height(),
               client_state.latestHeight());
      return ClientError::NON_MONOTONIC_HEIGHT;
    }
    return outcome::success();
  }

  outcome::result<LightClient::Update> LightClient::applyUpdate(
      const ClientState &client_state,
      const Header &header,
      Timestamp now) const {
    if (client_state.frozen) {
      SL_DEBUG(logger_, "Update #{} of frozen client", header.height());
      return ClientError::CLIENT_FROZEN;
    }
    OUTCOME_TRY(checkTemporal(client_state, header, now));
    OUTCOME_TRY(header.validateBasic(client_state.chain_id, *hasher_));

    auto res = verifier_->verify(client_state.latest_header.lightBlock(),
                                 header.lightBlock(),
                                 TrustOptions::from(client_state),
                                 now);
    if (res.has_error()) {
      SL_DEBUG(logger_,
               "Header #{} rejected ({}): {}",
               header.height(),
               classifyError(res.error()),
               res.error());
      return res.error();
    }

    Update update{
        .client_state = client_state,
        .consensus_state = consensusStateOf(header),
    };
    update.client_state.latest_header = header;

    SL_INFO(logger_,
            "Accepted header {}",
            LightBlockRef{header.height(),
                          header.signed_header.header.hash(*hasher_)});
    return update;
  }

  ConsensusState LightClient::consensusStateOf(const Header &header) const {
    auto &block_header = header.signed_header.header;
    return ConsensusState{
        .height = block_header.height,
        .timestamp = block_header.time,
        .root = MerkleRoot::fromAppHash(block_header.app_hash),
        .next_validators_hash = header.next_validator_set.hash(*hasher_),
    };
  }

}  // namespace light
