/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "verifier/header_provider.hpp"

namespace light::app {

  /**
   * Serves light blocks stored as `<dir>/<height>.ssz`
   */
  class FileHeaderProvider final : public HeaderProvider {
   public:
    FileHeaderProvider(qtils::SharedRef<log::LoggingSystem> logging_system,
                       std::filesystem::path directory);

    outcome::result<LightBlock> lightBlock(Height height) override;

    std::filesystem::path pathOf(Height height) const;

   private:
    log::Logger logger_;
    std::filesystem::path directory_;
  };

}  // namespace light::app
