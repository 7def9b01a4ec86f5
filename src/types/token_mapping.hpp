/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <compare>

#include "types/address.hpp"
#include "types/domain.hpp"

namespace bridge {

  struct TokenMappingKey {
    Domain source_domain = kInvalidDomain;
    Address source_token{};
    Domain target_domain = kInvalidDomain;

    auto operator<=>(const TokenMappingKey &) const = default;
  };

  struct TokenMapping {
    Domain source_domain = kInvalidDomain;
    Address source_token{};
    Domain target_domain = kInvalidDomain;
    Address synthetic{};
    /// Informational only, amounts are never rescaled
    uint8_t synthetic_decimals = 0;
    bool active = true;

    TokenMappingKey key() const {
      return {source_domain, source_token, target_domain};
    }

    bool operator==(const TokenMapping &) const = default;
  };

}  // namespace bridge
