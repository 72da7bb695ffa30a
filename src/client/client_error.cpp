/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/client_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(light, ClientError, e) {
  using E = ClientError;
  switch (e) {
    case E::CLIENT_FROZEN:
      return "Client is frozen";
    case E::TRUSTING_PERIOD_EXPIRED:
      return "Latest trusted header is outside of trusting period";
    case E::HEADER_OUTSIDE_TRUSTING_PERIOD:
      return "Header is too far ahead of latest trusted header";
    case E::NON_MONOTONIC_TIMESTAMP:
      return "Header time is not after latest trusted header";
    case E::NON_MONOTONIC_HEIGHT:
      return "Header height is not above latest trusted header";
  }
  return "Unknown ClientError";
}
