/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace bridge::access {

  enum class AccessError : uint8_t {
    UNAUTHORIZED = 1,
    ZERO_ADDRESS,
  };

}

OUTCOME_HPP_DECLARE_ERROR(bridge::access, AccessError);
