/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/client_state.hpp"

namespace light {

  /**
   * Parameters of a single verification, taken from the client state
   */
  struct TrustOptions {
    Fraction trust_level = Fraction::oneThird();
    Duration trusting_period{};
    Duration max_clock_drift{};

    static TrustOptions from(const ClientState &client_state) {
      return TrustOptions{
          .trust_level = client_state.trust_level,
          .trusting_period = client_state.trustingPeriod(),
          .max_clock_drift = client_state.maxClockDrift(),
      };
    }
  };

}  // namespace light
