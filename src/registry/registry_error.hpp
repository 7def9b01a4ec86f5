/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace bridge::registry {

  enum class RegistryError : uint8_t {
    INVALID_DOMAIN = 1,
    ZERO_ADDRESS,
    CHAIN_ALREADY_EXISTS,
    CHAIN_NOT_FOUND,
    TOKEN_MAPPING_NOT_FOUND,
  };

}

OUTCOME_HPP_DECLARE_ERROR(bridge::registry, RegistryError);
