/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include <qtils/outcome.hpp>

#include "types/token_mapping.hpp"

namespace bridge::registry {

  /**
   * Maps source-network tokens to the synthetic assets representing them on
   * a target network. Maintained by the owner only.
   */
  class TokenRegistry {
   public:
    virtual ~TokenRegistry() = default;

    /**
     * Creates the mapping, or overwrites an existing one; the mapping is
     * active afterwards
     */
    virtual outcome::result<void> registerTokenMapping(
        const Address &caller,
        Domain source_domain,
        const Address &source_token,
        Domain target_domain,
        const Address &synthetic,
        uint8_t synthetic_decimals) = 0;

    /**
     * Replaces the synthetic asset of an existing mapping. Balances held in
     * the previous asset are not migrated.
     * @returns TOKEN_MAPPING_NOT_FOUND for an unknown mapping
     */
    virtual outcome::result<void> updateTokenMapping(
        const Address &caller,
        Domain source_domain,
        const Address &source_token,
        Domain target_domain,
        const Address &synthetic,
        uint8_t synthetic_decimals) = 0;

    virtual outcome::result<void> setTokenMappingStatus(
        const Address &caller, const TokenMappingKey &key, bool active) = 0;

    virtual outcome::result<void> removeTokenMapping(
        const Address &caller, const TokenMappingKey &key) = 0;

    /// @returns zero address if the mapping is absent or inactive
    virtual Address getSyntheticToken(Domain source_domain,
                                      const Address &source_token,
                                      Domain target_domain) const = 0;

    virtual std::optional<TokenMapping> getTokenMapping(
        const TokenMappingKey &key) const = 0;

    virtual bool isTokenMappingActive(const TokenMappingKey &key) const = 0;

    /// @returns source tokens of `source_domain` having a mapping
    virtual std::vector<Address> getChainTokens(Domain source_domain) const = 0;

    /// @returns the source side of the mapping producing `synthetic`
    virtual std::optional<TokenMappingKey> getSourceToken(
        Domain target_domain, const Address &synthetic) const = 0;
  };

}  // namespace bridge::registry
