/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace light::app {

  using std::chrono_literals::operator""h;
  using std::chrono_literals::operator""s;

  Configuration::Configuration()
      : version_("undefined"),
        client_{
            .chain_id{},
            .trust_level = Fraction::oneThird(),
            .trusting_period = 14 * 24h,
            .unbonding_period = 21 * 24h,
            .max_clock_drift = 10s,
        } {}

  const std::string &Configuration::version() const {
    return version_;
  }

  Configuration::Command Configuration::command() const {
    return command_;
  }

  const Configuration::ClientConfig &Configuration::client() const {
    return client_;
  }

  const std::filesystem::path &Configuration::trustedHeaderFile() const {
    return trusted_header_file_;
  }

  const std::filesystem::path &Configuration::clientStateFile() const {
    return client_state_file_;
  }

  const std::filesystem::path &Configuration::headerFile() const {
    return header_file_;
  }

  const std::optional<std::filesystem::path> &Configuration::headersDir()
      const {
    return headers_dir_;
  }

  const std::filesystem::path &Configuration::outputFile() const {
    return output_file_;
  }

  const std::optional<std::filesystem::path> &
  Configuration::consensusOutputFile() const {
    return consensus_output_file_;
  }

}  // namespace light::app
