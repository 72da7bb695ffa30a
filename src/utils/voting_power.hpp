/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include "types/fraction.hpp"
#include "types/types.hpp"

namespace light {

  /**
   * @return true iff `power / total >= fraction`, compared exactly by
   * cross-multiplication
   */
  inline bool reachesFraction(VotingPower power,
                              VotingPower total,
                              const Fraction &fraction) {
    using boost::multiprecision::uint128_t;
    if (total == 0) {
      return false;
    }
    return uint128_t{power} * fraction.denominator
        >= uint128_t{total} * fraction.numerator;
  }

  /// Quorum of BFT consensus: at least 2/3 of the voting power
  inline bool reachesTwoThirds(VotingPower power, VotingPower total) {
    return reachesFraction(power, total, Fraction::twoThirds());
  }

}  // namespace light
