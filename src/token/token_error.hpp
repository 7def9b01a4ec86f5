/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace bridge::token {

  enum class TokenError : uint8_t {
    INSUFFICIENT_BALANCE = 1,
    INSUFFICIENT_ALLOWANCE,
    UNAUTHORIZED,
    ZERO_ADDRESS,
    SUPPLY_OVERFLOW,
    TOKEN_ALREADY_EXISTS,
    INVALID_DECIMALS,
    TOKEN_NOT_FOUND,
    INVALID_METADATA,
  };

}

OUTCOME_HPP_DECLARE_ERROR(bridge::token, TokenError);
