/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "app/impl/file_header_provider.hpp"
#include "app/ssz_files.hpp"
#include "client/client_store.hpp"
#include "client/error_kind.hpp"
#include "clock/impl/clock_impl.hpp"
#include "crypto/ed25519/ed25519_verifier.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "log/logger.hpp"

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using light::app::Configuration;
  using light::log::LoggingSystem;

  int fail(const light::log::Logger &logger,
           std::string_view what,
           const std::error_code &error) {
    auto kind = light::classifyError(error);
    SL_ERROR(logger, "{}: {} ({})", what, error, kind);
    fmt::println(std::cerr, "{}: {} ({})", what, error.message(), kind);
    return EXIT_FAILURE;
  }

  int run_create(const std::shared_ptr<LoggingSystem> &logsys,
                 const Configuration &appcfg) {
    auto logger = logsys->getLogger("Create", "app");
    auto hasher = std::make_shared<light::crypto::HasherImpl>();

    auto header_res =
        light::app::readSsz<light::Header>(appcfg.trustedHeaderFile());
    if (header_res.has_error()) {
      return fail(logger, "Can't read trusted header", header_res.error());
    }
    auto &header = header_res.value();
    auto &client_config = appcfg.client();

    light::ClientState client_state{
        .chain_id = client_config.chain_id.has_value()
                      ? light::toChainId(*client_config.chain_id)
                      : header.signed_header.header.chain_id,
        .trust_level = client_config.trust_level,
        .trusting_period =
            static_cast<uint64_t>(client_config.trusting_period.count()),
        .unbonding_period =
            static_cast<uint64_t>(client_config.unbonding_period.count()),
        .max_clock_drift =
            static_cast<uint64_t>(client_config.max_clock_drift.count()),
        .latest_header = header,
        .frozen = false,
    };
    if (auto res = client_state.validate(*hasher); res.has_error()) {
      return fail(logger, "Invalid client state", res.error());
    }
    if (auto res = light::app::writeSsz(appcfg.outputFile(), client_state);
        res.has_error()) {
      return fail(logger, "Can't write client state", res.error());
    }

    SL_INFO(logger,
            "Client of chain '{}' created at #{}",
            light::chainIdToString(client_state.chain_id),
            client_state.latestHeight());
    return EXIT_SUCCESS;
  }

  int run_update(const std::shared_ptr<LoggingSystem> &logsys,
                 const Configuration &appcfg) {
    auto logger = logsys->getLogger("Update", "app");

    auto client_state_res =
        light::app::readSsz<light::ClientState>(appcfg.clientStateFile());
    if (client_state_res.has_error()) {
      return fail(logger, "Can't read client state", client_state_res.error());
    }
    auto header_res = light::app::readSsz<light::Header>(appcfg.headerFile());
    if (header_res.has_error()) {
      return fail(logger, "Can't read header", header_res.error());
    }

    std::shared_ptr<light::HeaderProvider> header_provider;
    if (appcfg.headersDir().has_value()) {
      header_provider = std::make_shared<light::app::FileHeaderProvider>(
          logsys, appcfg.headersDir().value());
    }

    auto hasher = std::make_shared<light::crypto::HasherImpl>();
    auto commit_verifier = std::make_shared<light::CommitVerifier>(
        logsys, std::make_shared<light::crypto::Ed25519Verifier>());
    auto trust_verifier = std::make_shared<light::TrustVerifier>(
        logsys, hasher, commit_verifier, header_provider);
    auto light_client =
        std::make_shared<light::LightClient>(logsys, hasher, trust_verifier);

    auto store_res = light::ClientStore::create(
        logsys,
        hasher,
        light_client,
        std::make_shared<light::clock::SystemClockImpl>(),
        std::move(client_state_res.value()));
    if (store_res.has_error()) {
      return fail(logger, "Invalid client state", store_res.error());
    }
    auto &store = store_res.value();

    auto consensus_state_res = store->update(header_res.value());
    if (consensus_state_res.has_error()) {
      return fail(logger, "Update rejected", consensus_state_res.error());
    }

    if (auto res =
            light::app::writeSsz(appcfg.outputFile(), store->clientState());
        res.has_error()) {
      return fail(logger, "Can't write client state", res.error());
    }
    if (auto &path = appcfg.consensusOutputFile(); path.has_value()) {
      if (auto res = light::app::writeSsz(*path, consensus_state_res.value());
          res.has_error()) {
        return fail(logger, "Can't write consensus state", res.error());
      }
    }

    SL_INFO(logger, "Client updated to #{}", store->latestHeight());
    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("qlight");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc <= 1) {
    // Run without arguments
    wrong_usage();
    return EXIT_FAILURE;
  }

  auto app_configurator =
      std::make_unique<light::app::Configurator>(argc, argv);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<LoggingSystem>(std::move(logging_system));
  });

  logging_system->tuneLoggingSystem(app_configurator->getLoggingCliArgs());

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", "app");

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "See more details in the log");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  auto logger =
      logging_system->getLogger("Main", light::log::defaultGroupName);

  int exit_code = EXIT_FAILURE;
  switch (app_configuration->command()) {
    case Configuration::Command::Create:
      exit_code = run_create(logging_system, *app_configuration);
      break;
    case Configuration::Command::Update:
      exit_code = run_update(logging_system, *app_configuration);
      break;
  }

  logger->flush();
  return exit_code;
}
