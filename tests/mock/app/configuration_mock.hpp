/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */


#pragma once

#include <gmock/gmock.h>

#include "app/configuration.hpp"

namespace bridge::app {

  class ConfigurationMock : public Configuration {
   public:
    // clang-format off
    MOCK_METHOD(const std::string&, nodeVersion, (), (const, override));

    MOCK_METHOD(const HubConfig &, hub, (), (const, override));

    MOCK_METHOD(const DatabaseConfig &, database, (), (const, override));

    MOCK_METHOD(const std::vector<ChainConfig> &, chains, (), (const, override));

    MOCK_METHOD(const std::vector<TokenConfig> &, tokens, (), (const, override));
    // clang-format on
  };

}  // namespace bridge::app
