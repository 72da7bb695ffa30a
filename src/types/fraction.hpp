/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>
#include <qtils/outcome.hpp>
#include <sszpp/container.hpp>

#include "types/validation_error.hpp"

namespace light {

  /**
   * @struct Fraction
   * Rational number used as trust level: the share of trusted voting power
   * which must sign a non-adjacent header.
   */
  struct Fraction : ssz::ssz_container {
    uint64_t numerator = 1;
    uint64_t denominator = 3;

    SSZ_CONT(numerator, denominator);
    bool operator==(const Fraction &) const = default;

    static Fraction oneThird() {
      return Fraction{.numerator = 1, .denominator = 3};
    }

    static Fraction twoThirds() {
      return Fraction{.numerator = 2, .denominator = 3};
    }

    /// Trust level must be positive, at most 1 and at least 1/3
    outcome::result<void> validateTrustLevel() const {
      if (numerator == 0 or denominator == 0 or numerator > denominator) {
        return ValidationError::INVALID_TRUST_LEVEL;
      }
      // numerator / denominator >= 1 / 3, overflow-free
      if (numerator < denominator / 3
          or (numerator == denominator / 3 and denominator % 3 != 0)) {
        return ValidationError::INVALID_TRUST_LEVEL;
      }
      return outcome::success();
    }
  };

}  // namespace light

template <>
struct fmt::formatter<light::Fraction> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const light::Fraction &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}/{}", v.numerator, v.denominator);
  }
};
