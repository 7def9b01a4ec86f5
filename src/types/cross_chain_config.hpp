/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/address.hpp"
#include "types/domain.hpp"

namespace bridge {

  /**
   * Transport wiring of a gateway. The hub leaves the destination fields
   * unset: its peers come from the chain registry.
   */
  struct CrossChainConfig {
    Address transport{};
    Domain local_domain = kInvalidDomain;
    Domain destination_domain = kInvalidDomain;
    Address destination_gateway{};

    bool operator==(const CrossChainConfig &) const = default;
  };

}  // namespace bridge
