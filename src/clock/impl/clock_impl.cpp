/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/clock_impl.hpp"

namespace light::clock {

  Timestamp SystemClockImpl::now() const {
    return std::chrono::time_point_cast<Duration>(
        std::chrono::system_clock::now());
  }

}  // namespace light::clock
