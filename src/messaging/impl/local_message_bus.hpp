/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "log/logger.hpp"
#include "messaging/message_recipient.hpp"
#include "messaging/message_transport.hpp"

namespace bridge::messaging {

  /**
   * In-process transport between domains. Dispatched messages are queued
   * and delivered only on request, in any order, any number of times, which
   * reproduces the guarantees of a real at-least-once, unordered transport.
   *
   * Each domain gets one mailbox: the MessageTransport its components
   * dispatch through, and the identity recipients see as `caller`.
   */
  class LocalMessageBus final
      : public std::enable_shared_from_this<LocalMessageBus> {
   public:
    struct Envelope {
      MessageId id{};
      Domain origin_domain = kInvalidDomain;
      Address sender{};
      Domain destination_domain = kInvalidDomain;
      Address destination{};
      qtils::ByteVec body;
    };

    /// Delivered messages kept for redelivery by default
    static constexpr size_t kDefaultRedeliveryWindow = 1024;

    /**
     * @param redelivery_window number of the latest delivered messages
     * available to redeliver()
     */
    explicit LocalMessageBus(
        qtils::SharedRef<log::LoggingSystem> logsys,
        size_t redelivery_window = kDefaultRedeliveryWindow);

    /**
     * Opens the mailbox of `domain`; `address` is the transport identity on
     * that domain
     */
    outcome::result<std::shared_ptr<MessageTransport>> openMailbox(
        Domain domain, const Address &address);

    /// Routes messages for `(domain, address)` to `recipient`
    void attach(Domain domain,
                const Address &address,
                std::weak_ptr<MessageRecipient> recipient);

    std::vector<Envelope> pending() const;

    size_t pendingCount() const;

    /**
     * Delivers the queued message at `index`. A message whose handling
     * failed stays queued at the same position, so it can be retried.
     * @returns result of the recipient's handling
     */
    outcome::result<void> deliver(size_t index);

    /**
     * Delivers all queued messages, oldest first
     * @returns number of messages handled successfully
     */
    size_t deliverAll();

    /// Same as deliverAll(), newest first
    size_t deliverAllReversed();

    /**
     * Delivers an already delivered message once more. Only the latest
     * `redelivery_window` delivered messages can be redelivered.
     */
    outcome::result<void> redeliver(const MessageId &id);

    /// Removes the queued message at `index` without delivering it
    outcome::result<void> drop(size_t index);

   private:
    class Mailbox;

    outcome::result<MessageId> enqueue(Domain origin_domain,
                                       const Address &sender,
                                       Domain destination_domain,
                                       const Address &destination,
                                       qtils::ByteVec body);

    outcome::result<void> handOver(const Envelope &envelope);

    log::Logger logger_;
    const size_t redelivery_window_;

    mutable std::mutex mutex_;
    std::map<Domain, Address> mailboxes_;
    std::map<std::pair<Domain, Address>, std::weak_ptr<MessageRecipient>>
        recipients_;
    std::deque<Envelope> queue_;
    std::deque<Envelope> delivered_;
  };

}  // namespace bridge::messaging
