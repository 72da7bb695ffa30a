/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

namespace light {

  /**
   * What a failed update means to its caller
   */
  enum class ErrorKind : uint8_t {
    /// Stale or misordered update; never retried
    TEMPORAL_VIOLATION,
    /// Signatures or hashes don't check out; may be an attack
    CRYPTO_VERIFICATION_FAILURE,
    /// Intermediate headers were unavailable; whole update may be retried
    PROVIDER_FAILURE,
    /// Terminal until the client is replaced
    CLIENT_FROZEN,
    /// Structurally invalid input
    MALFORMED_INPUT,
    UNKNOWN,
  };

  ErrorKind classifyError(const std::error_code &ec);

  std::string_view toString(ErrorKind kind);

}  // namespace light

template <>
struct fmt::formatter<light::ErrorKind> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(light::ErrorKind kind, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(light::toString(kind),
                                                    ctx);
  }
};
