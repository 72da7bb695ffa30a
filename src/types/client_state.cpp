/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "types/client_state.hpp"

namespace light {

  outcome::result<void> ClientState::validate(
      const crypto::Hasher &hasher) const {
    OUTCOME_TRY(validateChainId(chain_id));
    OUTCOME_TRY(trust_level.validateTrustLevel());
    if (trusting_period == 0) {
      return ValidationError::INVALID_TRUSTING_PERIOD;
    }
    if (unbonding_period == 0) {
      return ValidationError::INVALID_UNBONDING_PERIOD;
    }
    if (max_clock_drift == 0) {
      return ValidationError::INVALID_MAX_CLOCK_DRIFT;
    }
    for (auto period : {trusting_period, unbonding_period, max_clock_drift}) {
      if (period > kMaxDurationNs) {
        return ValidationError::PERIOD_OUT_OF_RANGE;
      }
    }
    if (trusting_period >= unbonding_period) {
      return ValidationError::TRUSTING_PERIOD_NOT_BELOW_UNBONDING;
    }
    OUTCOME_TRY(latest_header.validateBasic(chain_id, hasher));
    return outcome::success();
  }

}  // namespace light
