/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/types.hpp"

namespace light::clock {

  /**
   * Wall clock of the verifier. Verification never reads time from anywhere
   * else, so tests can drive it.
   */
  class SystemClock {
   public:
    virtual ~SystemClock() = default;

    /**
     * @return current time with nanosecond resolution
     */
    [[nodiscard]] virtual Timestamp now() const = 0;
  };

}  // namespace light::clock
