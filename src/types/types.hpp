/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cinttypes>

#include <qtils/byte_arr.hpp>

#include "crypto/hash_types.hpp"
#include "types/constants.hpp"

namespace light {

  using Height = uint64_t;
  using VotingPower = uint64_t;

  using Address = qtils::ByteArr<ADDRESS_SIZE>;
  using PublicKey = qtils::ByteArr<PUBLIC_KEY_SIZE>;

  constexpr Hash256 kZeroHash;

  /// Timestamps travel over the wire as nanoseconds since Unix epoch
  using TimestampNs = uint64_t;

  using Duration = std::chrono::nanoseconds;
  using Timestamp = std::chrono::time_point<std::chrono::system_clock, Duration>;

  inline Timestamp toTimestamp(TimestampNs ns) {
    return Timestamp{Duration{static_cast<Duration::rep>(ns)}};
  }

  inline TimestampNs toTimestampNs(Timestamp timestamp) {
    return static_cast<TimestampNs>(timestamp.time_since_epoch().count());
  }

}  // namespace light
