/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "messaging/message_codec.hpp"

#include <boost/endian/conversion.hpp>

#include "crypto/sha/sha256.hpp"
#include "messaging/messaging_error.hpp"
#include "serde/serialization.hpp"

namespace bridge::messaging {

  outcome::result<qtils::ByteVec> encodeBody(const Message &message) {
    MessageBody body;
    body.kind = static_cast<uint8_t>(message.kind);
    body.token = message.token;
    body.recipient = message.recipient;
    body.amount = toWord(message.amount);
    body.origin_domain = message.origin_domain;
    body.sequence = message.sequence;
    return encode(body);
  }

  outcome::result<Message> decodeMessage(const Address &sender,
                                         qtils::ByteView body) {
    if (body.size() != kEncodedBodySize) {
      return MessagingError::MALFORMED_MESSAGE;
    }
    auto decoded_res = decode<MessageBody>(body);
    if (decoded_res.has_error()) {
      return MessagingError::MALFORMED_MESSAGE;
    }
    auto &decoded = decoded_res.value();

    auto kind = static_cast<MessageKind>(decoded.kind);
    if (kind != MessageKind::DEPOSIT and kind != MessageKind::RELEASE) {
      return MessagingError::UNKNOWN_MESSAGE_KIND;
    }

    return Message{
        .kind = kind,
        .origin_domain = decoded.origin_domain,
        .sender = sender,
        .token = decoded.token,
        .recipient = decoded.recipient,
        .amount = fromWord(decoded.amount),
        .sequence = decoded.sequence,
    };
  }

  MessageId computeMessageId(Domain origin_domain,
                             const Address &sender,
                             qtils::ByteView body) {
    qtils::ByteVec preimage(sizeof(Domain));
    boost::endian::store_big_u32(preimage.data(), origin_domain);
    preimage.insert(preimage.end(), sender.begin(), sender.end());
    preimage.insert(preimage.end(), body.begin(), body.end());
    return crypto::sha256(preimage);
  }

}  // namespace bridge::messaging
