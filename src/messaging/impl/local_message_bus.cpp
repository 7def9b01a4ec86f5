/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "messaging/impl/local_message_bus.hpp"

#include <algorithm>
#include <optional>

#include "messaging/message_codec.hpp"
#include "messaging/messaging_error.hpp"

namespace bridge::messaging {

  class LocalMessageBus::Mailbox final : public MessageTransport {
   public:
    Mailbox(std::weak_ptr<LocalMessageBus> bus,
            Domain domain,
            const Address &address)
        : bus_(std::move(bus)), domain_(domain), address_(address) {}

    const Address &address() const override {
      return address_;
    }

    outcome::result<MessageId> dispatch(const Address &sender,
                                        Domain destination_domain,
                                        const Address &destination,
                                        qtils::ByteVec body) override {
      auto bus = bus_.lock();
      if (not bus) {
        return MessagingError::TRANSPORT_GONE;
      }
      return bus->enqueue(
          domain_, sender, destination_domain, destination, std::move(body));
    }

   private:
    std::weak_ptr<LocalMessageBus> bus_;
    const Domain domain_;
    const Address address_;
  };

  LocalMessageBus::LocalMessageBus(qtils::SharedRef<log::LoggingSystem> logsys,
                                   size_t redelivery_window)
      : logger_(logsys->getLogger("LocalMessageBus", "messaging")),
        redelivery_window_(redelivery_window) {}

  outcome::result<std::shared_ptr<MessageTransport>>
  LocalMessageBus::openMailbox(Domain domain, const Address &address) {
    std::lock_guard lock{mutex_};
    if (mailboxes_.contains(domain)) {
      return MessagingError::MAILBOX_ALREADY_OPEN;
    }
    mailboxes_.emplace(domain, address);
    SL_DEBUG(logger_, "Mailbox of domain {} opened as {:0x}", domain, address);
    return std::make_shared<Mailbox>(weak_from_this(), domain, address);
  }

  void LocalMessageBus::attach(Domain domain,
                               const Address &address,
                               std::weak_ptr<MessageRecipient> recipient) {
    std::lock_guard lock{mutex_};
    recipients_[{domain, address}] = std::move(recipient);
  }

  std::vector<LocalMessageBus::Envelope> LocalMessageBus::pending() const {
    std::lock_guard lock{mutex_};
    return {queue_.begin(), queue_.end()};
  }

  size_t LocalMessageBus::pendingCount() const {
    std::lock_guard lock{mutex_};
    return queue_.size();
  }

  outcome::result<MessageId> LocalMessageBus::enqueue(
      Domain origin_domain,
      const Address &sender,
      Domain destination_domain,
      const Address &destination,
      qtils::ByteVec body) {
    auto id = computeMessageId(origin_domain, sender, body);
    std::lock_guard lock{mutex_};
    SL_TRACE(logger_,
             "Message {:0x} queued: {}:{:0x} -> {}:{:0x}",
             id,
             origin_domain,
             sender,
             destination_domain,
             destination);
    queue_.emplace_back(Envelope{
        .id = id,
        .origin_domain = origin_domain,
        .sender = sender,
        .destination_domain = destination_domain,
        .destination = destination,
        .body = std::move(body),
    });
    return id;
  }

  outcome::result<void> LocalMessageBus::handOver(const Envelope &envelope) {
    std::shared_ptr<MessageRecipient> recipient;
    Address caller{};
    {
      std::lock_guard lock{mutex_};
      auto mailbox_it = mailboxes_.find(envelope.destination_domain);
      auto recipient_it = recipients_.find(
          {envelope.destination_domain, envelope.destination});
      if (mailbox_it == mailboxes_.end()
          or recipient_it == recipients_.end()) {
        return MessagingError::UNKNOWN_DESTINATION;
      }
      recipient = recipient_it->second.lock();
      if (not recipient) {
        return MessagingError::UNKNOWN_DESTINATION;
      }
      caller = mailbox_it->second;
    }
    // handled without the bus lock: the recipient may dispatch
    return recipient->handle(
        caller, envelope.origin_domain, envelope.sender, envelope.body);
  }

  outcome::result<void> LocalMessageBus::deliver(size_t index) {
    Envelope envelope;
    {
      std::lock_guard lock{mutex_};
      if (index >= queue_.size()) {
        return MessagingError::MESSAGE_NOT_FOUND;
      }
      auto it = std::next(queue_.begin(), static_cast<std::ptrdiff_t>(index));
      envelope = std::move(*it);
      queue_.erase(it);
    }

    auto res = handOver(envelope);

    std::lock_guard lock{mutex_};
    if (res.has_error()) {
      SL_DEBUG(logger_,
               "Delivery of message {:0x} failed: {}",
               envelope.id,
               res.error());
      auto pos = std::min(index, queue_.size());
      queue_.insert(std::next(queue_.begin(), static_cast<std::ptrdiff_t>(pos)),
                    std::move(envelope));
      return res.as_failure();
    }
    delivered_.emplace_back(std::move(envelope));
    while (delivered_.size() > redelivery_window_) {
      delivered_.pop_front();
    }
    return outcome::success();
  }

  size_t LocalMessageBus::deliverAll() {
    size_t handled = 0;
    size_t index = 0;
    while (index < pendingCount()) {
      if (deliver(index).has_value()) {
        ++handled;
      } else {
        ++index;
      }
    }
    return handled;
  }

  size_t LocalMessageBus::deliverAllReversed() {
    size_t handled = 0;
    auto count = pendingCount();
    while (count > 0) {
      --count;
      if (deliver(count).has_value()) {
        ++handled;
      }
    }
    return handled;
  }

  outcome::result<void> LocalMessageBus::redeliver(const MessageId &id) {
    std::optional<Envelope> envelope;
    {
      std::lock_guard lock{mutex_};
      auto it = std::ranges::find_if(
          delivered_, [&](const Envelope &e) { return e.id == id; });
      if (it == delivered_.end()) {
        return MessagingError::MESSAGE_NOT_FOUND;
      }
      envelope = *it;
    }
    SL_TRACE(logger_, "Redelivering message {:0x}", id);
    return handOver(envelope.value());
  }

  outcome::result<void> LocalMessageBus::drop(size_t index) {
    std::lock_guard lock{mutex_};
    if (index >= queue_.size()) {
      return MessagingError::MESSAGE_NOT_FOUND;
    }
    auto it = std::next(queue_.begin(), static_cast<std::ptrdiff_t>(index));
    SL_DEBUG(logger_, "Message {:0x} dropped", it->id);
    queue_.erase(it);
    return outcome::success();
  }

}  // namespace bridge::messaging
