/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "types/light_block.hpp"

namespace light {

  /**
   * Source of historical light blocks of the counterparty chain, used only by
   * bisection. A call may be slow and may fail, e.g. when it goes over the
   * network; a failure makes the verification fail with NO_TRUST_PATH.
   */
  class HeaderProvider {
   public:
    virtual ~HeaderProvider() = default;

    /// Signed header at `height` together with the validator set that signed it
    virtual outcome::result<LightBlock> lightBlock(Height height) = 0;
  };

}  // namespace light
