/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <iostream>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(light::log, Error, e) {
  using E = light::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::WRONG_LOGGER:
      return "Unknown logger";
  }
  return "Unknown log::Error";
}

namespace light::log {

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "verbose") {
      return Level::VERBOSE;
    }
    if (str == "info" or str == "inf") {
      return Level::INFO;
    }
    if (str == "warning" or str == "warn") {
      return Level::WARN;
    }
    if (str == "error" or str == "err") {
      return Level::ERROR;
    }
    if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    }
    if (str == "off" or str == "no") {
      return Level::OFF;
    }
    return Error::WRONG_LEVEL;
  }

  outcome::result<std::pair<std::string, Level>> parseLevelOverride(
      std::string_view chunk) {
    auto eq = chunk.find('=');
    if (eq == std::string_view::npos) {
      OUTCOME_TRY(level, str2lvl(chunk));
      return std::make_pair(defaultGroupName, level);
    }
    auto group_name = chunk.substr(0, eq);
    if (group_name.empty()) {
      return Error::WRONG_GROUP;
    }
    OUTCOME_TRY(level, str2lvl(chunk.substr(eq + 1)));
    return std::make_pair(std::string(group_name), level);
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  void LoggingSystem::tuneLoggingSystem(const std::vector<std::string> &cfg) {
    for (auto &chunk : cfg) {
      auto res = parseLevelOverride(chunk);
      if (res.has_error()) {
        std::cerr << "Invalid logging override '" << chunk
                  << "': " << res.error().message() << '\n';
        continue;
      }
      auto &[group_name, level] = res.value();
      if (not logging_system_->getGroup(group_name)) {
        std::cerr << "Unknown logging group: " << group_name << '\n';
        continue;
      }
      logging_system_->setLevelOfGroup(group_name, level);
    }
  }

}  // namespace light::log
