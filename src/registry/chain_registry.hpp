/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <qtils/outcome.hpp>

#include "types/chain_endpoint.hpp"

namespace bridge::registry {

  /**
   * Directory of remote networks and the one gateway trusted on each of
   * them. Entries are maintained by the owner only.
   */
  class ChainRegistry {
   public:
    virtual ~ChainRegistry() = default;

    /// @returns CHAIN_ALREADY_EXISTS if the domain is already registered
    virtual outcome::result<void> registerChain(const Address &caller,
                                                Domain domain,
                                                const Address &gateway,
                                                std::string name) = 0;

    /// @returns CHAIN_NOT_FOUND if the domain is not registered
    virtual outcome::result<void> updateChain(const Address &caller,
                                              Domain domain,
                                              const Address &gateway,
                                              std::string name) = 0;

    /// Registers the domain or replaces its gateway, keeping the name
    virtual outcome::result<void> setChainEndpoint(const Address &caller,
                                                   Domain domain,
                                                   const Address &gateway) = 0;

    /// Inactive chains are kept but are not trusted
    virtual outcome::result<void> setChainStatus(const Address &caller,
                                                 Domain domain,
                                                 bool active) = 0;

    virtual outcome::result<void> removeChain(const Address &caller,
                                              Domain domain) = 0;

    virtual std::optional<ChainEndpoint> getChainEndpoint(
        Domain domain) const = 0;

    /// @returns true iff `sender` is the gateway of an active `domain`
    virtual bool isTrustedSender(Domain domain,
                                 const Address &sender) const = 0;

    virtual std::vector<ChainEndpoint> getAllChains() const = 0;

    virtual std::vector<ChainEndpoint> getActiveChains() const = 0;
  };

}  // namespace bridge::registry
