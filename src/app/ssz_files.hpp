/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <fstream>

#include <qtils/enum_error_code.hpp>
#include <qtils/read_file.hpp>

#include "serde/serialization.hpp"

namespace light::app {

  enum class SszFileError : uint8_t {
    WriteFailed = 1,
  };
  Q_ENUM_ERROR_CODE(SszFileError) {
    using E = decltype(e);
    switch (e) {
      case E::WriteFailed:
        return "Failed to write file";
    }
    abort();
  }

  /// Reads and decodes value stored by `writeSsz`
  template <typename T>
  outcome::result<T> readSsz(const std::filesystem::path &path) {
    BOOST_OUTCOME_TRY(auto bytes, qtils::readBytes(path));
    return decode<T>(bytes);
  }

  template <typename T>
  outcome::result<void> writeSsz(const std::filesystem::path &path,
                                 const T &value) {
    OUTCOME_TRY(bytes, encode(value));
    std::ofstream file{path, std::ios::binary | std::ios::trunc};
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    file.write(reinterpret_cast<const char *>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (not file) {
      return SszFileError::WriteFailed;
    }
    return outcome::success();
  }

}  // namespace light::app
