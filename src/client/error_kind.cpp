/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "client/error_kind.hpp"

#include "client/client_error.hpp"
#include "serde/serialization.hpp"
#include "types/validation_error.hpp"
#include "verifier/verification_error.hpp"

namespace light {

  namespace {
    template <typename Enum>
    bool isOf(const std::error_code &ec) {
      return ec.category() == std::error_code(Enum{}).category();
    }

    ErrorKind classify(VerificationError e) {
      using E = VerificationError;
      switch (e) {
        case E::NON_INCREASING_HEIGHT:
        case E::NON_INCREASING_TIME:
        case E::HEADER_FROM_FUTURE:
        case E::TRUSTED_HEADER_EXPIRED:
          return ErrorKind::TEMPORAL_VIOLATION;
        case E::NO_TRUST_PATH:
          return ErrorKind::PROVIDER_FAILURE;
        case E::INSUFFICIENT_VOTING_POWER:
        case E::INSUFFICIENT_TRUST:
        case E::VALIDATOR_SET_MISMATCH:
        case E::INVALID_SIGNATURE:
        case E::INVALID_COMMIT:
          return ErrorKind::CRYPTO_VERIFICATION_FAILURE;
      }
      return ErrorKind::UNKNOWN;
    }

    ErrorKind classify(ClientError e) {
      if (e == ClientError::CLIENT_FROZEN) {
        return ErrorKind::CLIENT_FROZEN;
      }
      return ErrorKind::TEMPORAL_VIOLATION;
    }
  }  // namespace

  ErrorKind classifyError(const std::error_code &ec) {
    if (isOf<ClientError>(ec)) {
      return classify(static_cast<ClientError>(ec.value()));
    }
    if (isOf<VerificationError>(ec)) {
      return classify(static_cast<VerificationError>(ec.value()));
    }
    if (isOf<ValidationError>(ec) or isOf<SszError>(ec)) {
      return ErrorKind::MALFORMED_INPUT;
    }
    return ErrorKind::UNKNOWN;
  }

  std::string_view toString(ErrorKind kind) {
    switch (kind) {
      case ErrorKind::TEMPORAL_VIOLATION:
        return "temporal violation";
      case ErrorKind::CRYPTO_VERIFICATION_FAILURE:
        return "crypto verification failure";
      case ErrorKind::PROVIDER_FAILURE:
        return "provider failure";
      case ErrorKind::CLIENT_FROZEN:
        return "client frozen";
      case ErrorKind::MALFORMED_INPUT:
        return "malformed input";
      case ErrorKind::UNKNOWN:
        return "unknown";
    }
    abort();
  }

}  // namespace light
