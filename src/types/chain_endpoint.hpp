/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "types/address.hpp"
#include "types/domain.hpp"

namespace bridge {

  /// The single trusted gateway of a remote network
  struct ChainEndpoint {
    Domain domain = kInvalidDomain;
    Address gateway{};
    std::string name;
    bool active = true;

    bool operator==(const ChainEndpoint &) const = default;
  };

}  // namespace bridge
