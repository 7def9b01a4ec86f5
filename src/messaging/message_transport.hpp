/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

#include "types/address.hpp"
#include "types/domain.hpp"
#include "types/message.hpp"

namespace bridge::messaging {

  /**
   * Authenticated cross-domain messaging. Messages sent through it reach the
   * recipient eventually, possibly out of order and more than once.
   */
  class MessageTransport {
   public:
    virtual ~MessageTransport() = default;

    /// Identity the transport uses as `caller` when delivering
    virtual const Address &address() const = 0;

    /**
     * Queues the message for delivery and returns immediately
     * @returns identifier of the message
     */
    virtual outcome::result<MessageId> dispatch(
        const Address &sender,
        Domain destination_domain,
        const Address &destination,
        qtils::ByteVec body) = 0;
  };

}  // namespace bridge::messaging
