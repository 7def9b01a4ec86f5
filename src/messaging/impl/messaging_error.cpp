/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "messaging/messaging_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(bridge::messaging, MessagingError, e) {
  using E = bridge::messaging::MessagingError;
  switch (e) {
    case E::MALFORMED_MESSAGE:
      return "Message body can not be decoded";
    case E::UNKNOWN_MESSAGE_KIND:
      return "Message body has unknown kind";
    case E::UNKNOWN_DESTINATION:
      return "No recipient is attached for the destination";
    case E::MAILBOX_ALREADY_OPEN:
      return "Mailbox for the domain is already open";
    case E::MESSAGE_NOT_FOUND:
      return "Message is not found";
    case E::TRANSPORT_GONE:
      return "Transport has been destroyed";
  }
  return "Unknown error";
}
