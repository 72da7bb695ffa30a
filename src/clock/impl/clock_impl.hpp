/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace light::clock {

  class SystemClockImpl : public SystemClock {
   public:
    Timestamp now() const override;
  };

}  // namespace light::clock
