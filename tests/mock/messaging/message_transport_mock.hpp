/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "messaging/message_transport.hpp"

namespace bridge::messaging {

  class MessageTransportMock : public MessageTransport {
   public:
    MOCK_METHOD(const Address &, address, (), (const, override));

    MOCK_METHOD(outcome::result<MessageId>,
                dispatch,
                (const Address &sender,
                 Domain destination_domain,
                 const Address &destination,
                 qtils::ByteVec body),
                (override));
  };

}  // namespace bridge::messaging
