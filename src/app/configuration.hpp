/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "types/fraction.hpp"

namespace light::app {

  class Configuration {
   public:
    enum class Command : uint8_t {
      /// Build a client state from a trusted header
      Create,
      /// Apply a header to a stored client state
      Update,
    };

    struct ClientConfig {
      std::optional<std::string> chain_id;
      Fraction trust_level;
      std::chrono::nanoseconds trusting_period;
      std::chrono::nanoseconds unbonding_period;
      std::chrono::nanoseconds max_clock_drift;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &version() const;
    [[nodiscard]] virtual Command command() const;
    [[nodiscard]] virtual const ClientConfig &client() const;

    /// Header to trust initially (create)
    [[nodiscard]] virtual const std::filesystem::path &trustedHeaderFile()
        const;
    /// Stored client state (update)
    [[nodiscard]] virtual const std::filesystem::path &clientStateFile() const;
    /// Candidate header (update)
    [[nodiscard]] virtual const std::filesystem::path &headerFile() const;
    /// Light blocks for bisection, named `<height>.ssz` (update)
    [[nodiscard]] virtual const std::optional<std::filesystem::path> &
    headersDir() const;
    /// Where the resulting client state is written
    [[nodiscard]] virtual const std::filesystem::path &outputFile() const;
    [[nodiscard]] virtual const std::optional<std::filesystem::path> &
    consensusOutputFile() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    Command command_ = Command::Create;
    ClientConfig client_;

    std::filesystem::path trusted_header_file_;
    std::filesystem::path client_state_file_;
    std::filesystem::path header_file_;
    std::optional<std::filesystem::path> headers_dir_;
    std::filesystem::path output_file_;
    std::optional<std::filesystem::path> consensus_output_file_;
  };

}  // namespace light::app
