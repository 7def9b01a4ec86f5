/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace bridge::gateway {

  enum class GatewayError : uint8_t {
    NOT_CONFIGURED = 1,
    INVALID_CONFIG,
    ZERO_AMOUNT,
    ZERO_ADDRESS,
    NOT_WHITELISTED,
    INSUFFICIENT_FUNDS,
    UNAUTHORIZED,
    UNTRUSTED_ORIGIN,
    MALFORMED_MESSAGE,
    UNEXPECTED_MESSAGE_KIND,
    TOKEN_MAPPING_NOT_FOUND,
    INSUFFICIENT_CUSTODY,
  };

}

OUTCOME_HPP_DECLARE_ERROR(bridge::gateway, GatewayError);
