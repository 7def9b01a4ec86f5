/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "hub/hub_ledger.hpp"
#include "types/address.hpp"
#include "types/domain.hpp"

namespace bridge::app {

  /**
   * Deployment of the hub side of the bridge: the hub itself, the remote
   * chains it trusts and the tokens it accepts from them.
   */
  class Configuration {
   public:
    struct HubConfig {
      Domain domain = kInvalidDomain;
      Address address{};
      Address owner{};
      hub::UnmappedTokenPolicy unmapped_token_policy =
          hub::UnmappedTokenPolicy::REJECT;
    };

    /// Empty directory selects the in-memory store
    struct DatabaseConfig {
      std::filesystem::path directory;
      size_t cache_size = 64 << 20;  // 64MiB
    };

    struct ChainConfig {
      Domain domain = kInvalidDomain;
      Address gateway{};
      std::string name;
      bool active = true;
    };

    /// Source token and the synthetic asset created for it on the hub
    struct TokenConfig {
      Domain source_domain = kInvalidDomain;
      Address source_token{};
      std::string name;
      std::string symbol;
      uint8_t decimals = 18;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &nodeVersion() const;

    [[nodiscard]] virtual const HubConfig &hub() const;

    [[nodiscard]] virtual const DatabaseConfig &database() const;

    [[nodiscard]] virtual const std::vector<ChainConfig> &chains() const;

    [[nodiscard]] virtual const std::vector<TokenConfig> &tokens() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    HubConfig hub_;
    DatabaseConfig database_;
    std::vector<ChainConfig> chains_;
    std::vector<TokenConfig> tokens_;
  };

}  // namespace bridge::app
