/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace bridge::messaging {

  enum class MessagingError : uint8_t {
    MALFORMED_MESSAGE = 1,
    UNKNOWN_MESSAGE_KIND,
    UNKNOWN_DESTINATION,
    MAILBOX_ALREADY_OPEN,
    MESSAGE_NOT_FOUND,
    TRANSPORT_GONE,
  };

}

OUTCOME_HPP_DECLARE_ERROR(bridge::messaging, MessagingError);
