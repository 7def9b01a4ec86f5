/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <optional>

#include "token/mintable_token.hpp"
#include "types/domain.hpp"

namespace bridge::token {

  /// Resolves synthetic asset addresses to the assets themselves
  class SyntheticAssetProvider {
   public:
    virtual ~SyntheticAssetProvider() = default;

    /// @returns nullptr for an unknown address
    virtual std::shared_ptr<MintableToken> getSyntheticAsset(
        const Address &synthetic) const = 0;

    /// @returns domain of the collateral backing the asset
    virtual std::optional<Domain> getSourceDomain(
        const Address &synthetic) const = 0;
  };

}  // namespace bridge::token
