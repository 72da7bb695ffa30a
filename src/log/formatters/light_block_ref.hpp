/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "types/types.hpp"

namespace light {
  /// Height and hash of a header, as printed in logs
  struct LightBlockRef {
    Height height;
    const Hash256 &hash;
  };
}  // namespace light

template <>
struct fmt::formatter<light::LightBlockRef> {
  // Presentation format
  bool long_form = false;

  // Parses format specifications of the form ['s' | 'l'].
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end) {
      if (*it == 'l' or *it == 's') {
        long_form = *it == 'l';
        ++it;
      }
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const light::LightBlockRef &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (long_form) {
      return fmt::format_to(ctx.out(), "#{} ({:0xx})", v.height, v.hash);
    }
    return fmt::format_to(ctx.out(), "#{} ({:0x})", v.height, v.hash);
  }
};
