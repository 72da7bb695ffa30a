/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>
#include <fmt/chrono.h>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(light::app, Configurator::Error, e) {
  using E = light::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown Configurator::Error");
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  template <typename T>
  std::optional<T> find_argument(boost::program_options::variables_map &vm,
                                 const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return it->second.as<T>();
      }
    }
    return std::nullopt;
  }

  constexpr std::string_view kUsage =
      "Usage:\n"
      "  qlight create --trusted-header <file> --output <file> [options]\n"
      "  qlight update --client-state <file> --header <file> [options]\n";
}  // namespace

namespace light::app {

  Configurator::Configurator(int argc, const char **argv)
      : argc_(argc), argv_(argv) {
    config_ = std::make_shared<Configuration>();
    config_->version_ = buildVersion();

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("command", po::value<std::string>(), "Command to run: create or update.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lverifier=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description client_options("Client options");
    client_options.add_options()
        ("chain-id", po::value<std::string>(), "Chain id of counterparty chain. Defaults to the one of trusted header.")
        ("trust-level", po::value<std::string>(), "Share of trusted voting power required for skipping verification, as num/den. Default: 1/3.")
        ("trusting-period", po::value<std::string>(), "Duration a header stays usable as trust anchor, e.g. 336h. Default: 14 days.")
        ("unbonding-period", po::value<std::string>(), "Unbonding period of counterparty chain. Default: 21 days.")
        ("max-clock-drift", po::value<std::string>(), "Allowed lead of header time over local clock. Default: 10s.")
        ;

    po::options_description file_options("File options");
    file_options.add_options()
        ("trusted-header", po::value<std::string>(), "SSZ-encoded header to trust initially (create).")
        ("client-state", po::value<std::string>(), "SSZ-encoded client state (update).")
        ("header", po::value<std::string>(), "SSZ-encoded header to verify (update).")
        ("headers-dir", po::value<std::string>(), "Directory of SSZ-encoded light blocks named <height>.ssz used for bisection (update).")
        ("output,o", po::value<std::string>(), "Where to write resulting client state. Default for update: --client-state.")
        ("consensus-output", po::value<std::string>(), "Where to write consensus state of accepted header (update).")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(client_options)
        .add(file_options);
    cli_positional_.add("command", 1);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "qlight version " << buildVersion() << '\n';
      std::cout << kUsage << '\n';
      std::cout << cli_options_ << '\n';
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "qlight version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(cli_options_)
                                      .positional(cli_positional_)
                                      .run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    return false;
  }

  std::vector<std::string> Configurator::getLoggingCliArgs() const {
    if (auto it = cli_values_map_.find("log"); it != cli_values_map_.end()) {
      return it->second.as<std::vector<std::string>>();
    }
    return {};
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stderr
    thread: none
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: light
        children:
          - name: verifier
          - name: client
          - name: app
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initClientConfig());
    OUTCOME_TRY(initCommandConfig());

    return config_;
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initClientConfig() {
    auto &client = config_->client_;

    auto set_duration = [](const std::string &value,
                           std::chrono::nanoseconds &target) {
      auto duration = util::parseTimeDuration(value);
      if (not duration.has_value() or duration->count() <= 0) {
        return false;
      }
      target = duration.value();
      return true;
    };
    auto set_trust_level = [&](const std::string &value) {
      auto fraction = util::parseFraction(value);
      if (not fraction.has_value()) {
        return false;
      }
      client.trust_level = fraction.value();
      return true;
    };

    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["client"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto scalar = [&](const char *key) -> std::optional<std::string> {
            auto node = section[key];
            if (not node.IsDefined()) {
              return std::nullopt;
            }
            if (not node.IsScalar()) {
              file_errors_ << "E: Value 'client." << key
                           << "' must be scalar\n";
              file_has_error_ = true;
              return std::nullopt;
            }
            return node.as<std::string>();
          };

          if (auto value = scalar("chain-id")) {
            boost::trim(*value);
            client.chain_id = *value;
          }
          if (auto value = scalar("trust-level")) {
            if (not set_trust_level(*value)) {
              file_errors_ << "E: Bad 'client.trust-level' value; "
                              "Expected: 1/3, 2/3, etc.\n";
              file_has_error_ = true;
            }
          }
          std::pair<const char *, std::chrono::nanoseconds *> durations[] = {
              {"trusting-period", &client.trusting_period},
              {"unbonding-period", &client.unbonding_period},
              {"max-clock-drift", &client.max_clock_drift},
          };
          for (auto &[key, target] : durations) {
            if (auto value = scalar(key)) {
              if (not set_duration(*value, *target)) {
                file_errors_ << "E: Bad 'client." << key
                             << "' value; Expected: 10s, 500ms, 336h, etc.\n";
                file_has_error_ = true;
              }
            }
          }
        } else {
          file_errors_ << "E: Section 'client' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    bool fail = false;

    find_argument<std::string>(
        cli_values_map_, "chain-id", [&](const std::string &value) {
          client.chain_id = value;
        });
    find_argument<std::string>(
        cli_values_map_, "trust-level", [&](const std::string &value) {
          if (not set_trust_level(value)) {
            SL_ERROR(logger_, "Bad 'trust-level' value: {}", value);
            fail = true;
          }
        });
    for (auto [key, target] :
         {std::pair{"trusting-period", &client.trusting_period},
          std::pair{"unbonding-period", &client.unbonding_period},
          std::pair{"max-clock-drift", &client.max_clock_drift}}) {
      find_argument<std::string>(
          cli_values_map_, key, [&](const std::string &value) {
            if (not set_duration(value, *target)) {
              SL_ERROR(logger_, "Bad '{}' value: {}", key, value);
              fail = true;
            }
          });
    }
    if (fail) {
      return Error::InvalidValue;
    }

    // Check values
    if (client.trust_level.validateTrustLevel().has_error()) {
      SL_ERROR(logger_,
               "The 'trust-level' must be within [1/3, 1]: {}",
               client.trust_level);
      return Error::InvalidValue;
    }
    if (client.trusting_period >= client.unbonding_period) {
      SL_ERROR(logger_,
               "The 'trusting-period' ({}) must be less than "
               "'unbonding-period' ({})",
               client.trusting_period,
               client.unbonding_period);
      return Error::InvalidValue;
    }
    if (client.chain_id.has_value() and client.chain_id->empty()) {
      SL_ERROR(logger_, "The 'chain-id' must not be empty");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initCommandConfig() {
    auto command = find_argument<std::string>(cli_values_map_, "command");
    if (not command.has_value()) {
      SL_ERROR(logger_, "Command is not specified");
      std::cerr << kUsage;
      return Error::CliArgsParseFailed;
    }
    if (*command == "create") {
      config_->command_ = Configuration::Command::Create;
    } else if (*command == "update") {
      config_->command_ = Configuration::Command::Update;
    } else {
      SL_ERROR(logger_, "Unknown command: {}", *command);
      std::cerr << kUsage;
      return Error::CliArgsParseFailed;
    }

    auto existing_file =
        [&](const char *key) -> outcome::result<std::filesystem::path> {
      auto value = find_argument<std::string>(cli_values_map_, key);
      if (not value.has_value()) {
        SL_ERROR(logger_, "The '{}' must be provided for {}", key, *command);
        return Error::InvalidValue;
      }
      std::filesystem::path path{*value};
      if (not is_regular_file(path)) {
        SL_ERROR(logger_,
                 "The '{}' file does not exist or is not a file: {}",
                 key,
                 path.c_str());
        return Error::InvalidValue;
      }
      return path;
    };

    auto output = find_argument<std::string>(cli_values_map_, "output");

    if (config_->command_ == Configuration::Command::Create) {
      OUTCOME_TRY(trusted_header, existing_file("trusted-header"));
      config_->trusted_header_file_ = std::move(trusted_header);
      if (not output.has_value()) {
        SL_ERROR(logger_, "The 'output' must be provided for create");
        return Error::InvalidValue;
      }
      config_->output_file_ = *output;
      return outcome::success();
    }

    OUTCOME_TRY(client_state, existing_file("client-state"));
    OUTCOME_TRY(header, existing_file("header"));
    config_->client_state_file_ = std::move(client_state);
    config_->header_file_ = std::move(header);
    config_->output_file_ =
        output.has_value() ? std::filesystem::path{*output}
                           : config_->client_state_file_;

    if (auto dir = find_argument<std::string>(cli_values_map_, "headers-dir")) {
      std::filesystem::path path{*dir};
      if (not is_directory(path)) {
        SL_ERROR(logger_,
                 "The 'headers-dir' does not exist or is not a directory: {}",
                 path.c_str());
        return Error::InvalidValue;
      }
      config_->headers_dir_ = std::move(path);
    }
    if (auto consensus_output =
            find_argument<std::string>(cli_values_map_, "consensus-output")) {
      config_->consensus_output_file_ = *consensus_output;
    }

    return outcome::success();
  }

}  // namespace light::app
