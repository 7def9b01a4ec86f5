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
#include "registry/token_registry.hpp"

namespace bridge::registry {

  class TokenRegistryImpl final : public TokenRegistry, public access::Ownable {
   public:
    TokenRegistryImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                      const Address &owner);

    outcome::result<void> registerTokenMapping(
        const Address &caller,
        Domain source_domain,
        const Address &source_token,
        Domain target_domain,
        const Address &synthetic,
        uint8_t synthetic_decimals) override;

    outcome::result<void> updateTokenMapping(
        const Address &caller,
        Domain source_domain,
        const Address &source_token,
        Domain target_domain,
        const Address &synthetic,
        uint8_t synthetic_decimals) override;

    outcome::result<void> setTokenMappingStatus(const Address &caller,
                                                const TokenMappingKey &key,
                                                bool active) override;

    outcome::result<void> removeTokenMapping(
        const Address &caller, const TokenMappingKey &key) override;

    Address getSyntheticToken(Domain source_domain,
                              const Address &source_token,
                              Domain target_domain) const override;

    std::optional<TokenMapping> getTokenMapping(
        const TokenMappingKey &key) const override;

    bool isTokenMappingActive(const TokenMappingKey &key) const override;

    std::vector<Address> getChainTokens(Domain source_domain) const override;

    std::optional<TokenMappingKey> getSourceToken(
        Domain target_domain, const Address &synthetic) const override;

   private:
    using ReverseKey = std::pair<Domain, Address>;

    static outcome::result<void> validate(const TokenMapping &mapping);

    /// Puts the mapping and keeps the reverse index in step. Needs the lock.
    void store(TokenMapping mapping);

    log::Logger logger_;

    mutable std::mutex mutex_;
    std::map<TokenMappingKey, TokenMapping> mappings_;
    std::map<ReverseKey, TokenMappingKey> reverse_;
  };

}  // namespace bridge::registry
