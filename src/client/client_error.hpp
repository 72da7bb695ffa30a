/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace light {

  /// Rejections of an update by the client itself, before any crypto
  enum class ClientError : uint8_t {
    CLIENT_FROZEN = 1,
    TRUSTING_PERIOD_EXPIRED,
    HEADER_OUTSIDE_TRUSTING_PERIOD,
    NON_MONOTONIC_TIMESTAMP,
    NON_MONOTONIC_HEIGHT,
  };

}  // namespace light

OUTCOME_HPP_DECLARE_ERROR(light, ClientError);
