/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#ifndef QLIGHT_VERSION
#define QLIGHT_VERSION "undefined"
#endif

namespace light {

  /// Version the build system stamped into the binary
  inline const std::string &buildVersion() {
    static const std::string version{QLIGHT_VERSION};
    return version;
  }

}  // namespace light
