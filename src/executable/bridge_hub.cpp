/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>

#include "app/bootstrap.hpp"
#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "executable/cmd_decode_message.hpp"
#include "log/logger.hpp"

using std::string_view_literals::operator""sv;

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using bridge::app::Configuration;
  using bridge::log::LoggingSystem;

  int run_hub(std::shared_ptr<LoggingSystem> logsys,
              std::shared_ptr<Configuration> appcfg) {
    auto logger = logsys->getLogger("Main", bridge::log::defaultGroupName);

    std::shared_ptr<bridge::storage::SpacedStorage> storage;
    try {
      storage = bridge::app::openStorage(logsys, appcfg);
    } catch (const std::system_error &e) {
      SL_CRITICAL(logger, "Can't open database: {}", e.what());
      return EXIT_FAILURE;
    }

    auto components_res =
        bridge::app::assembleHub(logsys, appcfg, std::move(storage));
    if (components_res.has_error()) {
      SL_CRITICAL(
          logger, "Failed to set up the hub: {}", components_res.error());
      return EXIT_FAILURE;
    }
    auto &components = components_res.value();

    const auto &hub = appcfg->hub();
    SL_INFO(logger,
            "Hub {:0x} on domain {} is ready. Version: {}",
            hub.address,
            hub.domain,
            appcfg->nodeVersion());
    SL_INFO(logger,
            "Unmapped token deposits are {}",
            hub.unmapped_token_policy == bridge::hub::UnmappedTokenPolicy::REJECT
                ? "rejected"
                : "absorbed");

    for (const auto &chain : components.chain_registry->getAllChains()) {
      SL_INFO(logger,
              "Chain {} '{}': gateway {:0x}{}",
              chain.domain,
              chain.name,
              chain.gateway,
              chain.active ? "" : " (inactive)");
    }
    for (const auto &info : components.token_factory->getAllSyntheticTokens()) {
      SL_INFO(logger,
              "Token {} of domain {} ({:0x}) is represented by {:0x}",
              info.symbol,
              info.source_domain,
              info.source_token,
              info.synthetic);
    }

    SL_INFO(logger, "Hub stopped");
    logger->flush();

    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv, const char **env) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("bridge-hub");

  auto getArg = [&](size_t i) {
    return static_cast<ptrdiff_t>(i) < argc
             ? std::make_optional(std::string_view{argv[i]})
             : std::nullopt;
  };

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc == 0) {
    // Abnormal run
    wrong_usage();
    return EXIT_FAILURE;
  }

  if (argc == 1) {
    // Run without arguments
    wrong_usage();
    return EXIT_FAILURE;
  }

  if (getArg(1) == "decode-message") {
    return cmdDecodeMessage(getArg);
  }

  auto app_configurator =
      std::make_unique<bridge::app::Configurator>(argc, argv, env);

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

    std::make_shared<bridge::log::LoggingSystem>(std::move(logging_system));
  });

  logging_system->tuneLoggingSystem(app_configurator->getLoggingCliArgs());

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", "configurator");

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

  std::string_view name{argv[1]};
  if (name.substr(0, 1) != "-") {
    // No subcommand, but argument is not a valid option: begins not with dash
    wrong_usage();
    return EXIT_FAILURE;
  }

  return run_hub(logging_system, app_configuration);
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
