/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "testutil/prepare_loggers.hpp"

using light::app::Configuration;
using light::app::Configurator;
using namespace std::chrono_literals;

/**
 * Runs the configurator on a command line, with files it refers to created
 * in a scratch directory
 */
class ConfiguratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir = std::filesystem::temp_directory_path()
        / ("qlight_configurator_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    touch("trusted.ssz");
    touch("state.ssz");
    touch("header.ssz");
    std::filesystem::create_directories(dir / "headers");
  }

  void TearDown() override {
    std::filesystem::remove_all(dir);
  }

  std::string touch(const std::string &name, const std::string &content = {}) {
    auto path = dir / name;
    std::ofstream{path} << content;
    return path.string();
  }

  std::string pathOf(const std::string &name) const {
    return (dir / name).string();
  }

  outcome::result<std::shared_ptr<Configuration>> configure(
      std::vector<std::string> args) {
    args.insert(args.begin(), "qlight");
    std::vector<const char *> argv;
    for (auto &arg : args) {
      argv.push_back(arg.c_str());
    }
    Configurator configurator(static_cast<int>(argv.size()), argv.data());
    OUTCOME_TRY(exit, configurator.step1());
    EXPECT_FALSE(exit);
    OUTCOME_TRY(configurator.step2());
    return configurator.calculateConfig(logsys->getLogger("Test", "testing"));
  }

  qtils::SharedRef<light::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  std::filesystem::path dir;
};

TEST_F(ConfiguratorTest, CreateWithDefaults) {
  ASSERT_OUTCOME_SUCCESS(config,
                         configure({"create",
                                    "--trusted-header",
                                    pathOf("trusted.ssz"),
                                    "-o",
                                    pathOf("out.ssz")}));
  EXPECT_EQ(config->command(), Configuration::Command::Create);
  EXPECT_EQ(config->trustedHeaderFile(), dir / "trusted.ssz");
  EXPECT_EQ(config->outputFile(), dir / "out.ssz");

  const auto &client = config->client();
  EXPECT_EQ(client.chain_id, std::nullopt);
  EXPECT_EQ(client.trust_level, light::Fraction::oneThird());
  EXPECT_EQ(client.trusting_period, 14 * 24h);
  EXPECT_EQ(client.unbonding_period, 21 * 24h);
  EXPECT_EQ(client.max_clock_drift, 10s);
}

TEST_F(ConfiguratorTest, UpdateOutputDefaultsToClientState) {
  ASSERT_OUTCOME_SUCCESS(config,
                         configure({"update",
                                    "--client-state",
                                    pathOf("state.ssz"),
                                    "--header",
                                    pathOf("header.ssz"),
                                    "--headers-dir",
                                    pathOf("headers")}));
  EXPECT_EQ(config->command(), Configuration::Command::Update);
  EXPECT_EQ(config->outputFile(), dir / "state.ssz");
  EXPECT_EQ(config->headersDir(), dir / "headers");
  EXPECT_EQ(config->consensusOutputFile(), std::nullopt);
}

/**
 * @given config file with client section
 * @when some of its values are also given on command line
 * @then command line wins, file fills the rest
 */
TEST_F(ConfiguratorTest, CommandLineOverridesFile) {
  auto config_file = touch("config.yaml", R"(
client:
  chain-id: " chain-A "
  trust-level: 2/3
  trusting-period: 7d
  max-clock-drift: 3s
)");
  ASSERT_OUTCOME_SUCCESS(config,
                         configure({"create",
                                    "-c",
                                    config_file,
                                    "--trusted-header",
                                    pathOf("trusted.ssz"),
                                    "-o",
                                    pathOf("out.ssz"),
                                    "--max-clock-drift",
                                    "500ms"}));
  const auto &client = config->client();
  EXPECT_EQ(client.chain_id, "chain-A");
  EXPECT_EQ(client.trust_level, light::Fraction::twoThirds());
  EXPECT_EQ(client.trusting_period, 7 * 24h);
  EXPECT_EQ(client.unbonding_period, 21 * 24h);
  EXPECT_EQ(client.max_clock_drift, 500ms);
}

TEST_F(ConfiguratorTest, BadFileValue) {
  auto config_file = touch("config.yaml", "client:\n  trusting-period: soon\n");
  EXPECT_OUTCOME_ERROR(res,
                       configure({"create",
                                  "-c",
                                  config_file,
                                  "--trusted-header",
                                  pathOf("trusted.ssz"),
                                  "-o",
                                  pathOf("out.ssz")}),
                       Configurator::Error::ConfigFileParseFailed);
}

TEST_F(ConfiguratorTest, InvalidValues) {
  auto create = [&](std::vector<std::string> extra) {
    std::vector<std::string> args{"create",
                                  "--trusted-header",
                                  pathOf("trusted.ssz"),
                                  "-o",
                                  pathOf("out.ssz")};
    args.insert(args.end(), extra.begin(), extra.end());
    return configure(args);
  };
  EXPECT_OUTCOME_ERROR(res1,
                       create({"--trust-level", "1/4"}),
                       Configurator::Error::InvalidValue);
  EXPECT_OUTCOME_ERROR(res2,
                       create({"--trust-level", "third"}),
                       Configurator::Error::InvalidValue);
  EXPECT_OUTCOME_ERROR(res3,
                       create({"--trusting-period", "21d"}),
                       Configurator::Error::InvalidValue);
  EXPECT_OUTCOME_ERROR(res4,
                       create({"--max-clock-drift", "0s"}),
                       Configurator::Error::InvalidValue);
  EXPECT_OUTCOME_ERROR(res5,
                       create({"--chain-id", ""}),
                       Configurator::Error::InvalidValue);
}

TEST_F(ConfiguratorTest, MissingInputs) {
  EXPECT_OUTCOME_ERROR(res1,
                       configure({"--trusted-header", pathOf("trusted.ssz")}),
                       Configurator::Error::CliArgsParseFailed);
  EXPECT_OUTCOME_ERROR(res2,
                       configure({"verify"}),
                       Configurator::Error::CliArgsParseFailed);
  EXPECT_OUTCOME_ERROR(
      res3,
      configure({"create",
                 "--trusted-header",
                 pathOf("absent.ssz"),
                 "-o",
                 pathOf("out.ssz")}),
      Configurator::Error::InvalidValue);
  EXPECT_OUTCOME_ERROR(
      res4,
      configure({"update", "--client-state", pathOf("state.ssz")}),
                       Configurator::Error::InvalidValue);
}
