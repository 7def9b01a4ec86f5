/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>

#include "access/ownable.hpp"
#include "log/logger.hpp"
#include "registry/chain_registry.hpp"

namespace bridge::registry {

  class ChainRegistryImpl final : public ChainRegistry, public access::Ownable {
   public:
    ChainRegistryImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                      const Address &owner);

    outcome::result<void> registerChain(const Address &caller,
                                        Domain domain,
                                        const Address &gateway,
                                        std::string name) override;

    outcome::result<void> updateChain(const Address &caller,
                                      Domain domain,
                                      const Address &gateway,
                                      std::string name) override;

    outcome::result<void> setChainEndpoint(const Address &caller,
                                           Domain domain,
                                           const Address &gateway) override;

    outcome::result<void> setChainStatus(const Address &caller,
                                         Domain domain,
                                         bool active) override;

    outcome::result<void> removeChain(const Address &caller,
                                      Domain domain) override;

    std::optional<ChainEndpoint> getChainEndpoint(Domain domain) const override;

    bool isTrustedSender(Domain domain, const Address &sender) const override;

    std::vector<ChainEndpoint> getAllChains() const override;

    std::vector<ChainEndpoint> getActiveChains() const override;

   private:
    static outcome::result<void> validate(Domain domain,
                                          const Address &gateway);

    log::Logger logger_;

    mutable std::mutex mutex_;
    std::map<Domain, ChainEndpoint> chains_;
  };

}  // namespace bridge::registry
