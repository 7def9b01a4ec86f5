/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace bridge::app {

  Configuration::Configuration()
      : version_("undefined"),
        database_{
            .directory{},
            .cache_size = 64 << 20,
        } {}

  const std::string &Configuration::nodeVersion() const {
    return version_;
  }

  const Configuration::HubConfig &Configuration::hub() const {
    return hub_;
  }

  const Configuration::DatabaseConfig &Configuration::database() const {
    return database_;
  }

  const std::vector<Configuration::ChainConfig> &Configuration::chains()
      const {
    return chains_;
  }

  const std::vector<Configuration::TokenConfig> &Configuration::tokens()
      const {
    return tokens_;
  }

}  // namespace bridge::app
