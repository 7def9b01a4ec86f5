/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <print>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(bridge::app, Configurator::Error, e) {
  using E = bridge::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  return "Unknown app::Configurator::Error";
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

  std::optional<bridge::hub::UnmappedTokenPolicy> parsePolicy(
      std::string_view value) {
    if (bridge::util::iequals(value, "reject")) {
      return bridge::hub::UnmappedTokenPolicy::REJECT;
    }
    if (bridge::util::iequals(value, "absorb")) {
      return bridge::hub::UnmappedTokenPolicy::ABSORB;
    }
    return std::nullopt;
  }
}  // namespace

namespace bridge::app {

  Configurator::Configurator(int argc, const char **argv, const char **env)
      : argc_(argc), argv_(argv), env_(env) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();

    config_->database_.directory.clear();
    config_->database_.cache_size = 64 << 20;  // 64MiB

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("config,c", po::value<std::string>(), "Filepath to load configuration from.")
        ("unmapped_token_policy", po::value<std::string>(), "Treatment of deposits of unmapped tokens: 'reject' (default) or 'absorb'.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lhub=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description storage_options("Storage options");
    storage_options.add_options()
        ("db_path", po::value<std::string>(), "Path to DB directory. In-memory storage is used if not set.")
        ("db_cache_size", po::value<uint32_t>()->default_value(config_->database_.cache_size), "Limit the memory the database cache can use <bytes>.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(storage_options);
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
      std::cout << "Bridge hub version " << buildVersion() << '\n';
      std::cout << cli_options_ << '\n';
      std::println(std::cout, "Other commands:");
      std::println(std::cout,
                   "  bridge_hub decode-message <origin-domain> <sender> "
                   "<body-hex>");
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "Bridge hub version " << buildVersion() << '\n';
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
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          logger_cli_args_ = values;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: bridge
        children:
          - name: configurator
          - name: registry
          - name: token
          - name: messaging
          - name: gateway
          - name: hub
          - name: storage
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
    OUTCOME_TRY(initHubConfig());
    OUTCOME_TRY(initDatabaseConfig());
    OUTCOME_TRY(initChainsConfig());
    OUTCOME_TRY(initTokensConfig());

    return config_;
  }

  outcome::result<void> Configurator::checkFileErrors() {
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

  std::optional<Address> Configurator::readAddress(const YAML::Node &node,
                                                   std::string_view name) {
    if (not node.IsDefined()) {
      file_errors_ << "E: Value '" << name << "' is required\n";
      file_has_error_ = true;
      return std::nullopt;
    }
    if (not node.IsScalar()) {
      file_errors_ << "E: Value '" << name << "' must be scalar\n";
      file_has_error_ = true;
      return std::nullopt;
    }
    auto value = node.as<std::string>();
    boost::trim(value);
    auto address = util::parseAddress(value);
    if (not address.has_value()) {
      file_errors_ << "E: Value '" << name
                   << "' must be a hex address of at most 32 bytes\n";
      file_has_error_ = true;
    }
    return address;
  }

  std::optional<Domain> Configurator::readDomain(const YAML::Node &node,
                                                 std::string_view name) {
    if (not node.IsDefined()) {
      file_errors_ << "E: Value '" << name << "' is required\n";
      file_has_error_ = true;
      return std::nullopt;
    }
    try {
      auto value = node.as<uint64_t>();
      if (value == kInvalidDomain
          or value > std::numeric_limits<Domain>::max()) {
        file_errors_ << "E: Value '" << name
                     << "' must be a non-zero 32-bit number\n";
        file_has_error_ = true;
        return std::nullopt;
      }
      return static_cast<Domain>(value);
    } catch (const YAML::Exception &) {
      file_errors_ << "E: Value '" << name << "' must be a number\n";
      file_has_error_ = true;
      return std::nullopt;
    }
  }

  outcome::result<void> Configurator::initHubConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["hub"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          if (auto domain = readDomain(section["domain"], "hub.domain")) {
            config_->hub_.domain = domain.value();
          }
          if (auto address = readAddress(section["address"], "hub.address")) {
            config_->hub_.address = address.value();
          }
          if (auto owner = readAddress(section["owner"], "hub.owner")) {
            config_->hub_.owner = owner.value();
          }
          auto policy = section["unmapped_token_policy"];
          if (policy.IsDefined()) {
            if (policy.IsScalar()) {
              auto value = parsePolicy(policy.as<std::string>());
              if (value.has_value()) {
                config_->hub_.unmapped_token_policy = value.value();
              } else {
                file_errors_ << "E: Value 'hub.unmapped_token_policy' must be "
                                "'reject' or 'absorb'\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_
                  << "E: Value 'hub.unmapped_token_policy' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'hub' defined, but is not map\n";
          file_has_error_ = true;
        }
      } else {
        file_errors_ << "E: Section 'hub' is required\n";
        file_has_error_ = true;
      }
    } else {
      SL_ERROR(logger_, "Config file must be provided by option --config");
      return Error::InvalidValue;
    }

    OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    bool fail = false;
    find_argument<std::string>(
        cli_values_map_,
        "unmapped_token_policy",
        [&](const std::string &value) {
          auto policy = parsePolicy(value);
          if (policy.has_value()) {
            config_->hub_.unmapped_token_policy = policy.value();
          } else {
            std::cerr << "Option --unmapped_token_policy has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    // Check values
    if (isZero(config_->hub_.address) or isZero(config_->hub_.owner)) {
      SL_ERROR(logger_, "Hub address and owner must be non-zero");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initDatabaseConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["database"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto path = section["path"];
          if (path.IsDefined()) {
            if (path.IsScalar()) {
              auto value = path.as<std::string>();
              config_->database_.directory = value;
            } else {
              file_errors_ << "E: Value 'database.path' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto cache_size = section["cache_size"];
          if (cache_size.IsDefined()) {
            if (cache_size.IsScalar()) {
              auto value =
                  util::parseByteQuantity(cache_size.as<std::string>());
              if (value.has_value()) {
                config_->database_.cache_size = value.value();
              } else {
                file_errors_ << "E: Bad 'cache_size' value; "
                                "Expected: 4096, 512Mb, 1G, etc.\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'database.cache_size' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'database' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "db_path", [&](const std::string &value) {
          config_->database_.directory = value;
        });
    find_argument<uint32_t>(
        cli_values_map_, "db_cache_size", [&](const uint32_t &value) {
          config_->database_.cache_size = value;
        });

    if (not config_->database_.directory.empty()) {
      config_->database_.directory =
          std::filesystem::weakly_canonical(config_->database_.directory);
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initChainsConfig() {
    auto section = (*config_file_)["chains"];
    if (section.IsDefined()) {
      if (section.IsSequence()) {
        for (const auto &entry : section) {
          if (not entry.IsMap()) {
            file_errors_ << "E: Each entry of 'chains' must be a map\n";
            file_has_error_ = true;
            continue;
          }
          Configuration::ChainConfig chain;
          auto domain = readDomain(entry["domain"], "chains.domain");
          auto gateway = readAddress(entry["gateway"], "chains.gateway");
          if (not domain.has_value() or not gateway.has_value()) {
            continue;
          }
          chain.domain = domain.value();
          chain.gateway = gateway.value();
          if (auto name = entry["name"]; name.IsDefined()) {
            chain.name = name.as<std::string>();
          }
          if (auto active = entry["active"]; active.IsDefined()) {
            try {
              chain.active = active.as<bool>();
            } catch (const YAML::Exception &) {
              file_errors_ << "E: Value 'chains.active' must be boolean\n";
              file_has_error_ = true;
            }
          }
          if (chain.domain == config_->hub_.domain) {
            file_errors_ << "E: Chain " << chain.domain
                         << " has the domain of the hub\n";
            file_has_error_ = true;
            continue;
          }
          for (auto &known : config_->chains_) {
            if (known.domain == chain.domain) {
              file_errors_ << "E: Chain " << chain.domain
                           << " is defined twice\n";
              file_has_error_ = true;
            }
          }
          config_->chains_.emplace_back(std::move(chain));
        }
      } else {
        file_errors_ << "E: Section 'chains' defined, but is not sequence\n";
        file_has_error_ = true;
      }
    }

    return checkFileErrors();
  }

  outcome::result<void> Configurator::initTokensConfig() {
    auto section = (*config_file_)["tokens"];
    if (section.IsDefined()) {
      if (section.IsSequence()) {
        for (const auto &entry : section) {
          if (not entry.IsMap()) {
            file_errors_ << "E: Each entry of 'tokens' must be a map\n";
            file_has_error_ = true;
            continue;
          }
          Configuration::TokenConfig token;
          auto domain =
              readDomain(entry["source_domain"], "tokens.source_domain");
          auto source_token =
              readAddress(entry["source_token"], "tokens.source_token");
          if (not domain.has_value() or not source_token.has_value()) {
            continue;
          }
          token.source_domain = domain.value();
          token.source_token = source_token.value();
          auto symbol = entry["symbol"];
          if (not symbol.IsDefined() or not symbol.IsScalar()) {
            file_errors_ << "E: Value 'tokens.symbol' is required\n";
            file_has_error_ = true;
            continue;
          }
          token.symbol = symbol.as<std::string>();
          if (auto name = entry["name"]; name.IsDefined()) {
            token.name = name.as<std::string>();
          } else {
            token.name = token.symbol;
          }
          if (auto decimals = entry["decimals"]; decimals.IsDefined()) {
            try {
              auto value = decimals.as<uint32_t>();
              if (value > std::numeric_limits<uint8_t>::max()) {
                throw YAML::Exception({}, "out of range");
              }
              token.decimals = static_cast<uint8_t>(value);
            } catch (const YAML::Exception &) {
              file_errors_ << "E: Value 'tokens.decimals' must be a number "
                              "in range 0..255\n";
              file_has_error_ = true;
            }
          }
          config_->tokens_.emplace_back(std::move(token));
        }
      } else {
        file_errors_ << "E: Section 'tokens' defined, but is not sequence\n";
        file_has_error_ = true;
      }
    }

    return checkFileErrors();
  }

}  // namespace bridge::app
