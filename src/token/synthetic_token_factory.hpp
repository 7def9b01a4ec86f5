/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "token/synthetic_asset_provider.hpp"
#include "types/domain.hpp"

namespace bridge::token {

  /// Creates synthetic assets on the hub and keeps the directory of them
  class SyntheticTokenFactory : public SyntheticAssetProvider {
   public:
    struct TokenInfo {
      Address synthetic{};
      Domain source_domain = kInvalidDomain;
      Address source_token{};
      std::string name;
      std::string symbol;
      uint8_t decimals = 0;
      uint32_t generation = 0;

      bool operator==(const TokenInfo &) const = default;
    };

    /**
     * Creates the first synthetic asset for the source token, minted by the
     * hub ledger only. Its address is derived from the source coordinates.
     * @returns address of the new asset
     */
    virtual outcome::result<Address> createSyntheticToken(
        const Address &caller,
        Domain source_domain,
        const Address &source_token,
        std::string name,
        std::string symbol,
        uint8_t decimals) = 0;

    /**
     * Creates a further synthetic asset for a source token which already has
     * one, at an address of its own. Earlier assets stay usable; lookups by
     * source coordinates return the newest one.
     * @returns address of the new asset
     */
    virtual outcome::result<Address> replaceSyntheticToken(
        const Address &caller,
        Domain source_domain,
        const Address &source_token,
        std::string name,
        std::string symbol,
        uint8_t decimals) = 0;

    /// @returns the newest synthetic asset created for the source token
    virtual std::optional<Address> getSyntheticToken(
        Domain source_domain, const Address &source_token) const = 0;

    virtual std::optional<TokenInfo> getTokenInfo(
        const Address &synthetic) const = 0;

    virtual std::vector<TokenInfo> getAllSyntheticTokens() const = 0;
  };

}  // namespace bridge::token
