/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/file_header_provider.hpp"

#include <fmt/format.h>

#include "app/ssz_files.hpp"

namespace light::app {

  FileHeaderProvider::FileHeaderProvider(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      std::filesystem::path directory)
      : logger_(logging_system->getLogger("HeaderProvider", "app")),
        directory_(std::move(directory)) {}

  std::filesystem::path FileHeaderProvider::pathOf(Height height) const {
    return directory_ / fmt::format("{}.ssz", height);
  }

  outcome::result<LightBlock> FileHeaderProvider::lightBlock(Height height) {
    auto path = pathOf(height);
    SL_DEBUG(logger_, "Loading light block #{} from {}", height, path.c_str());
    auto res = readSsz<LightBlock>(path);
    if (res.has_error()) {
      SL_WARN(logger_,
              "Can't load light block #{} from {}: {}",
              height,
              path.c_str(),
              res.error());
    }
    return res;
  }

}  // namespace light::app
