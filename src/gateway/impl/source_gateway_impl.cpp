/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/impl/source_gateway_impl.hpp"

#include <qtils/error_throw.hpp>

#include "gateway/gateway_error.hpp"
#include "messaging/message_codec.hpp"
#include "messaging/messaging_error.hpp"
#include "storage/codec.hpp"

namespace bridge::gateway {

  namespace {
    const qtils::ByteVec kProcessedMark{1};
  }

  SourceGatewayImpl::SourceGatewayImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<storage::SpacedStorage> storage,
      const Address &owner,
      const Address &address)
      : Ownable(owner),
        logger_(logsys->getLogger("SourceGateway", "gateway")),
        space_(storage->getSpace(storage::Space::SourceGateway)),
        address_(address) {
    if (isZero(address_)) {
      qtils::raise(GatewayError::ZERO_ADDRESS);
    }
    if (auto res = storage::ensureSchemaVersion(*space_, kSchemaVersion);
        res.has_error()) {
      SL_CRITICAL(logger_, "Can't open gateway storage: {}", res.error());
      qtils::raise(res.error());
    }
  }

  outcome::result<MessageId> SourceGatewayImpl::deposit(
      const Address &caller,
      const Address &token_address,
      const Amount &amount,
      const Address &recipient) {
    std::lock_guard lock{mutex_};

    if (not config_.has_value() or not transport_) {
      return GatewayError::NOT_CONFIGURED;
    }
    if (amount == 0) {
      return GatewayError::ZERO_AMOUNT;
    }
    if (isZero(recipient)) {
      return GatewayError::ZERO_ADDRESS;
    }
    if (not whitelist_.contains(token_address)) {
      return GatewayError::NOT_WHITELISTED;
    }
    auto &token = *tokens_.at(token_address);
    if (token.balanceOf(caller) < amount
        or token.allowance(caller, address_) < amount) {
      return GatewayError::INSUFFICIENT_FUNDS;
    }

    auto nonce_key = storage::nonceKey(recipient);
    OUTCOME_TRY(sequence, storage::readU64(*space_, nonce_key));

    OUTCOME_TRY(body,
                messaging::encodeBody(Message{
                    .kind = MessageKind::DEPOSIT,
                    .origin_domain = config_->local_domain,
                    .sender = address_,
                    .token = token_address,
                    .recipient = recipient,
                    .amount = amount,
                    .sequence = sequence,
                }));

    if (auto res = token.transferFrom(address_, caller, address_, amount);
        res.has_error()) {
      SL_WARN(logger_,
              "Can't pull {} of {:0x} from {:0x}: {}",
              amount,
              token_address,
              caller,
              res.error());
      return GatewayError::INSUFFICIENT_FUNDS;
    }

    if (auto res = space_->put(nonce_key, storage::encodeU64(sequence + 1));
        res.has_error()) {
      SL_ERROR(logger_, "Can't persist deposit sequence: {}", res.error());
      refund(token, caller, amount);
      return res.as_failure();
    }

    auto id_res = transport_->dispatch(address_,
                                       config_->destination_domain,
                                       config_->destination_gateway,
                                       std::move(body));
    if (id_res.has_error()) {
      SL_WARN(logger_,
              "Dispatch of deposit for {:0x} failed, reverting: {}",
              recipient,
              id_res.error());
      refund(token, caller, amount);
      if (auto res = space_->put(nonce_key, storage::encodeU64(sequence));
          res.has_error()) {
        SL_ERROR(logger_, "Can't restore deposit sequence: {}", res.error());
      }
      return id_res.as_failure();
    }

    SL_INFO(logger_,
            "Deposit {:0x}: {} of {:0x} from {:0x} for {:0x} (seq {})",
            id_res.value(),
            amount,
            token_address,
            caller,
            recipient,
            sequence);
    return id_res.value();
  }

  void SourceGatewayImpl::refund(token::FungibleToken &token,
                                 const Address &depositor,
                                 const Amount &amount) {
    if (auto res = token.transfer(address_, depositor, amount);
        res.has_error()) {
      SL_CRITICAL(logger_,
                  "Refund of {} of {:0x} to {:0x} failed: {}",
                  amount,
                  token.address(),
                  depositor,
                  res.error());
    }
  }

  outcome::result<void> SourceGatewayImpl::handle(const Address &caller,
                                                  Domain origin_domain,
                                                  const Address &sender,
                                                  qtils::ByteView body) {
    std::lock_guard lock{mutex_};

    if (not config_.has_value() or caller != config_->transport) {
      SL_WARN(logger_, "Message from unauthorized caller {:0x}", caller);
      return GatewayError::UNAUTHORIZED;
    }
    if (origin_domain != config_->destination_domain
        or sender != config_->destination_gateway) {
      SL_WARN(logger_,
              "Message from untrusted origin {}:{:0x}",
              origin_domain,
              sender);
      return GatewayError::UNTRUSTED_ORIGIN;
    }

    auto id = messaging::computeMessageId(origin_domain, sender, body);
    auto processed_key = storage::processedMessageKey(id);
    OUTCOME_TRY(processed, space_->contains(processed_key));
    if (processed) {
      SL_DEBUG(logger_, "Message {:0x} is already processed", id);
      return outcome::success();
    }

    auto message_res = messaging::decodeMessage(sender, body);
    if (message_res.has_error()) {
      SL_WARN(logger_, "Message {:0x} rejected: {}", id, message_res.error());
      if (message_res.error() == messaging::MessagingError::UNKNOWN_MESSAGE_KIND) {
        return GatewayError::UNEXPECTED_MESSAGE_KIND;
      }
      return GatewayError::MALFORMED_MESSAGE;
    }
    auto &message = message_res.value();
    if (message.kind != MessageKind::RELEASE) {
      SL_WARN(logger_, "Message {:0x} is not a release", id);
      return GatewayError::UNEXPECTED_MESSAGE_KIND;
    }
    if (message.origin_domain != origin_domain) {
      SL_WARN(logger_,
              "Message {:0x} claims origin {} but came from {}",
              id,
              message.origin_domain,
              origin_domain);
      return GatewayError::UNTRUSTED_ORIGIN;
    }
    if (isZero(message.recipient)) {
      return GatewayError::MALFORMED_MESSAGE;
    }

    auto local_it = synthetic_to_local_.find(message.token);
    if (local_it == synthetic_to_local_.end()
        or not tokens_.contains(local_it->second)) {
      SL_WARN(logger_,
              "Message {:0x}: no local token for synthetic {:0x}",
              id,
              message.token);
      return GatewayError::TOKEN_MAPPING_NOT_FOUND;
    }
    auto &token = *tokens_.at(local_it->second);
    if (token.balanceOf(address_) < message.amount) {
      SL_WARN(logger_,
              "Message {:0x}: custody of {:0x} is less than {}",
              id,
              token.address(),
              message.amount);
      return GatewayError::INSUFFICIENT_CUSTODY;
    }

    OUTCOME_TRY(space_->put(processed_key, qtils::ByteVec{kProcessedMark}));
    if (auto res = token.transfer(address_, message.recipient, message.amount);
        res.has_error()) {
      SL_ERROR(logger_, "Release of message {:0x} failed: {}", id, res.error());
      if (auto undo = space_->remove(processed_key); undo.has_error()) {
        SL_CRITICAL(logger_,
                    "Can't unmark message {:0x}: {}",
                    id,
                    undo.error());
      }
      return res.as_failure();
    }

    SL_INFO(logger_,
            "Release {:0x}: {} of {:0x} to {:0x}",
            id,
            message.amount,
            token.address(),
            message.recipient);
    return outcome::success();
  }

  outcome::result<void> SourceGatewayImpl::addWhitelistedToken(
      const Address &caller, std::shared_ptr<token::FungibleToken> token) {
    OUTCOME_TRY(onlyOwner(caller));
    if (not token or isZero(token->address())) {
      return GatewayError::ZERO_ADDRESS;
    }
    std::lock_guard lock{mutex_};
    auto address = token->address();
    tokens_[address] = std::move(token);
    whitelist_.insert(address);
    SL_INFO(logger_, "Token {:0x} whitelisted", address);
    return outcome::success();
  }

  outcome::result<void> SourceGatewayImpl::removeWhitelistedToken(
      const Address &caller, const Address &token) {
    OUTCOME_TRY(onlyOwner(caller));
    std::lock_guard lock{mutex_};
    if (whitelist_.erase(token) != 0) {
      SL_INFO(logger_, "Token {:0x} removed from whitelist", token);
    }
    return outcome::success();
  }

  outcome::result<void> SourceGatewayImpl::setTokenMapping(
      const Address &caller,
      const Address &local_token,
      const Address &synthetic) {
    OUTCOME_TRY(onlyOwner(caller));
    if (isZero(local_token) or isZero(synthetic)) {
      return GatewayError::ZERO_ADDRESS;
    }
    std::lock_guard lock{mutex_};
    // a superseded synthetic still resolves to its local token
    local_to_synthetic_[local_token] = synthetic;
    synthetic_to_local_[synthetic] = local_token;
    SL_INFO(logger_,
            "Token {:0x} is represented by {:0x} on the hub",
            local_token,
            synthetic);
    return outcome::success();
  }

  outcome::result<void> SourceGatewayImpl::updateCrossChainConfig(
      const Address &caller,
      std::shared_ptr<messaging::MessageTransport> transport,
      Domain local_domain,
      Domain destination_domain,
      const Address &destination_gateway) {
    OUTCOME_TRY(onlyOwner(caller));
    if (not transport or local_domain == kInvalidDomain
        or destination_domain == kInvalidDomain
        or isZero(destination_gateway)) {
      return GatewayError::INVALID_CONFIG;
    }
    std::lock_guard lock{mutex_};
    config_ = CrossChainConfig{
        .transport = transport->address(),
        .local_domain = local_domain,
        .destination_domain = destination_domain,
        .destination_gateway = destination_gateway,
    };
    transport_ = std::move(transport);
    SL_INFO(logger_,
            "Cross-chain config updated: domain {}, hub {}:{:0x}",
            local_domain,
            destination_domain,
            destination_gateway);
    return outcome::success();
  }

  bool SourceGatewayImpl::isTokenWhitelisted(const Address &token) const {
    std::lock_guard lock{mutex_};
    return whitelist_.contains(token);
  }

  std::vector<Address> SourceGatewayImpl::getWhitelistedTokens() const {
    std::lock_guard lock{mutex_};
    return {whitelist_.begin(), whitelist_.end()};
  }

  Address SourceGatewayImpl::getTokenMapping(const Address &local_token) const {
    std::lock_guard lock{mutex_};
    auto it = local_to_synthetic_.find(local_token);
    return it == local_to_synthetic_.end() ? kZeroAddress : it->second;
  }

  Address SourceGatewayImpl::getReverseTokenMapping(
      const Address &synthetic) const {
    std::lock_guard lock{mutex_};
    auto it = synthetic_to_local_.find(synthetic);
    return it == synthetic_to_local_.end() ? kZeroAddress : it->second;
  }

  std::optional<CrossChainConfig> SourceGatewayImpl::getCrossChainConfig()
      const {
    std::lock_guard lock{mutex_};
    return config_;
  }

  outcome::result<bool> SourceGatewayImpl::isMessageProcessed(
      const MessageId &id) const {
    std::lock_guard lock{mutex_};
    return space_->contains(storage::processedMessageKey(id));
  }

  outcome::result<uint64_t> SourceGatewayImpl::getUserNonce(
      const Address &recipient) const {
    std::lock_guard lock{mutex_};
    return storage::readU64(*space_, storage::nonceKey(recipient));
  }

  Amount SourceGatewayImpl::getCustodyBalance(const Address &token) const {
    std::lock_guard lock{mutex_};
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
      return 0;
    }
    return it->second->balanceOf(address_);
  }

}  // namespace bridge::gateway
