/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <sstream>

#include <boost/program_options.hpp>
#include <log/logger.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <yaml-cpp/yaml.h>

#include "types/address.hpp"
#include "types/domain.hpp"

namespace soralog {
  class Logger;
}  // namespace soralog

namespace bridge::app {
  class Configuration;
}  // namespace bridge::app

namespace bridge::app {

  /**
   * Builds the Configuration from the YAML config file and the command line.
   * Command line options override values of the file.
   */
  class Configurator final {
   public:
    enum class Error : uint8_t {
      CliArgsParseFailed = 1,
      ConfigFileParseFailed,
      InvalidValue,
    };

    Configurator() = delete;
    Configurator(Configurator &&) noexcept = delete;
    Configurator(const Configurator &) = delete;
    ~Configurator() = default;
    Configurator &operator=(Configurator &&) noexcept = delete;
    Configurator &operator=(const Configurator &) = delete;

    Configurator(int argc, const char **argv, const char **env);

    // Parse CLI args for help, version and config
    outcome::result<bool> step1();

    // Parse remaining CLI args
    outcome::result<bool> step2();

    outcome::result<YAML::Node> getLoggingConfig();
    std::vector<std::string> getLoggingCliArgs() {
      return logger_cli_args_;
    }

    outcome::result<std::shared_ptr<Configuration>> calculateConfig(
        qtils::SharedRef<soralog::Logger> logger);

   private:
    outcome::result<void> initHubConfig();
    outcome::result<void> initDatabaseConfig();
    outcome::result<void> initChainsConfig();
    outcome::result<void> initTokensConfig();

    /// Reports accumulated config file problems
    outcome::result<void> checkFileErrors();

    std::optional<Address> readAddress(const YAML::Node &node,
                                       std::string_view name);
    std::optional<Domain> readDomain(const YAML::Node &node,
                                     std::string_view name);

    int argc_;
    const char **argv_;
    const char **env_;

    std::shared_ptr<Configuration> config_;
    std::shared_ptr<soralog::Logger> logger_;

    std::optional<YAML::Node> config_file_;
    bool file_has_error_ = false;
    std::ostringstream file_errors_;
    std::vector<std::string> logger_cli_args_;

    boost::program_options::options_description cli_options_;
    boost::program_options::variables_map cli_values_map_;
  };

}  // namespace bridge::app

OUTCOME_HPP_DECLARE_ERROR(bridge::app, Configurator::Error);
