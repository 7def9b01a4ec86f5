/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace bridge::hub {

  enum class HubError : uint8_t {
    NOT_CONFIGURED = 1,
    INVALID_CONFIG,
    UNAUTHORIZED,
    UNTRUSTED_ORIGIN,
    MALFORMED_MESSAGE,
    UNEXPECTED_MESSAGE_KIND,
    TOKEN_REGISTRY_NOT_SET,
    UNMAPPED_TOKEN,
    UNKNOWN_ASSET,
    ZERO_AMOUNT,
    ZERO_ADDRESS,
    UNKNOWN_CHAIN,
    WRONG_DESTINATION_CHAIN,
    INSUFFICIENT_BALANCE,
    BALANCE_OVERFLOW,
  };

}

OUTCOME_HPP_DECLARE_ERROR(bridge::hub, HubError);
