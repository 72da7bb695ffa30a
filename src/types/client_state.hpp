/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/container.hpp>

#include "types/fraction.hpp"
#include "types/header.hpp"

namespace light {

  /**
   * @struct ClientState
   * Light client of one counterparty chain: trust parameters and the latest
   * trusted header, which anchors every following verification.
   */
  struct ClientState : ssz::ssz_variable_size_container {
    ChainId chain_id;
    Fraction trust_level = Fraction::oneThird();
    /// Nanoseconds a header may serve as trust anchor after its time
    uint64_t trusting_period = 0;
    /// Nanoseconds
    uint64_t unbonding_period = 0;
    /// Nanoseconds a header may be ahead of the local clock
    uint64_t max_clock_drift = 0;
    Header latest_header;
    bool frozen = false;

    SSZ_CONT(chain_id,
             trust_level,
             trusting_period,
             unbonding_period,
             max_clock_drift,
             latest_header,
             frozen);
    bool operator==(const ClientState &) const = default;

    Height latestHeight() const {
      return latest_header.height();
    }

    Timestamp latestTimestamp() const {
      return latest_header.timestamp();
    }

    Duration trustingPeriod() const {
      return Duration{static_cast<Duration::rep>(trusting_period)};
    }

    Duration unbondingPeriod() const {
      return Duration{static_cast<Duration::rep>(unbonding_period)};
    }

    Duration maxClockDrift() const {
      return Duration{static_cast<Duration::rep>(max_clock_drift)};
    }

    /**
     * Checks trust parameters and the structure of the latest header.
     * Applied once, when a client is created or loaded.
     */
    outcome::result<void> validate(const crypto::Hasher &hasher) const;
  };

}  // namespace light
