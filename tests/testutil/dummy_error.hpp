/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace testutil {

  /// Error of a category unknown to the client, for classification tests
  enum class DummyError : uint8_t {
    ERROR = 1,
    ERROR_2,
  };
  Q_ENUM_ERROR_CODE(DummyError) {
    using E = decltype(e);
    switch (e) {
      case E::ERROR:
        return "dummy error";
      case E::ERROR_2:
        return "dummy error #2";
    }
    abort();
  }

}  // namespace testutil
