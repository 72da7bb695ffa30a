/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <limits>

namespace light {

  // List lengths

  static constexpr uint64_t MAX_VALIDATORS = 1 << 12;  // 4'096 validators
  static constexpr uint64_t MAX_CHAIN_ID_LENGTH = 50;

  // Crypto sizes

  static constexpr uint64_t ADDRESS_SIZE = 20;
  static constexpr uint64_t PUBLIC_KEY_SIZE = 32;
  static constexpr uint64_t SIGNATURE_SIZE = 64;

  /// Upper bound of the total voting power of a validator set.
  /// Keeps `power * numerator` products far from overflow.
  static constexpr uint64_t kMaxTotalVotingPower =
      std::numeric_limits<int64_t>::max() / 8;

  /// Upper bounds of wire timestamps and durations, in nanoseconds.
  /// A timestamp plus a duration still fits into signed 64-bit nanoseconds.
  static constexpr uint64_t kMaxTimestampNs =
      std::numeric_limits<int64_t>::max() / 2;
  static constexpr uint64_t kMaxDurationNs =
      std::numeric_limits<int64_t>::max() / 2;

  /// Maximum recursion depth of the bisection search
  static constexpr uint32_t kMaxBisectionDepth = 64;

  /// Message type of a precommit vote
  static constexpr uint8_t PRECOMMIT_TYPE = 2;

}  // namespace light
