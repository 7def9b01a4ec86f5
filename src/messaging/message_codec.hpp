/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/byte_view.hpp>
#include <qtils/outcome.hpp>

#include "types/message.hpp"

namespace bridge::messaging {

  outcome::result<qtils::ByteVec> encodeBody(const Message &message);

  /**
   * Decodes the body and joins it with the sender reported by the transport.
   * Fails with MALFORMED_MESSAGE on any size other than the fixed body size
   * and with UNKNOWN_MESSAGE_KIND on an unknown kind.
   */
  outcome::result<Message> decodeMessage(const Address &sender,
                                         qtils::ByteView body);

  /// sha256( be32(origin_domain) || sender || body )
  MessageId computeMessageId(Domain origin_domain,
                             const Address &sender,
                             qtils::ByteView body);

}  // namespace bridge::messaging
