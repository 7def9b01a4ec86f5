/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_view.hpp>
#include <qtils/outcome.hpp>

#include "types/address.hpp"
#include "types/domain.hpp"

namespace bridge::messaging {

  /// Endpoint the transport delivers inbound messages to
  class MessageRecipient {
   public:
    virtual ~MessageRecipient() = default;

    /**
     * Handles a delivered message. Delivery is at-least-once and unordered,
     * so implementations must be idempotent.
     * @param caller identity of the delivering transport
     * @param origin_domain domain the message was sent from, as attested by
     * the transport
     * @param sender address of the sending contract on the origin domain
     * @param body encoded message body
     */
    virtual outcome::result<void> handle(const Address &caller,
                                         Domain origin_domain,
                                         const Address &sender,
                                         qtils::ByteView body) = 0;
  };

}  // namespace bridge::messaging
