/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hub/impl/hub_ledger_impl.hpp"

#include <qtils/error_throw.hpp>

#include "hub/hub_error.hpp"
#include "messaging/message_codec.hpp"
#include "messaging/messaging_error.hpp"
#include "storage/codec.hpp"

namespace bridge::hub {

  namespace {
    const qtils::ByteVec kProcessedMark{1};

    std::string_view policyName(UnmappedTokenPolicy policy) {
      switch (policy) {
        case UnmappedTokenPolicy::REJECT:
          return "reject";
        case UnmappedTokenPolicy::ABSORB:
          return "absorb";
      }
      return "unknown";
    }
  }  // namespace

  HubLedgerImpl::HubLedgerImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<storage::SpacedStorage> storage,
      qtils::SharedRef<registry::ChainRegistry> chain_registry,
      qtils::SharedRef<token::SyntheticAssetProvider> assets,
      const Address &owner,
      const Address &address,
      UnmappedTokenPolicy policy)
      : Ownable(owner),
        logger_(logsys->getLogger("HubLedger", "hub")),
        space_(storage->getSpace(storage::Space::HubLedger)),
        chain_registry_(std::move(chain_registry)),
        assets_(std::move(assets)),
        address_(address),
        policy_(policy) {
    if (isZero(address_)) {
      qtils::raise(HubError::ZERO_ADDRESS);
    }
    if (auto res = storage::ensureSchemaVersion(*space_, kSchemaVersion);
        res.has_error()) {
      SL_CRITICAL(logger_, "Can't open ledger storage: {}", res.error());
      qtils::raise(res.error());
    }
    SL_VERBOSE(logger_,
               "Hub ledger {:0x} started, unmapped tokens policy: {}",
               address_,
               policyName(policy_));
  }

  outcome::result<void> HubLedgerImpl::handle(const Address &caller,
                                              Domain origin_domain,
                                              const Address &sender,
                                              qtils::ByteView body) {
    std::lock_guard lock{mutex_};

    if (not config_.has_value() or caller != config_->transport) {
      SL_WARN(logger_, "Message from unauthorized caller {:0x}", caller);
      return HubError::UNAUTHORIZED;
    }

    auto endpoint = chain_registry_->getChainEndpoint(origin_domain);
    if (not endpoint.has_value() or not endpoint->active
        or endpoint->gateway != sender) {
      SL_WARN(logger_,
              "Message from untrusted origin {}:{:0x}",
              origin_domain,
              sender);
      return HubError::UNTRUSTED_ORIGIN;
    }

    auto id = messaging::computeMessageId(origin_domain, sender, body);
    OUTCOME_TRY(processed,
                space_->contains(storage::processedMessageKey(id)));
    if (processed) {
      SL_DEBUG(logger_, "Message {:0x} is already processed", id);
      return outcome::success();
    }

    auto message_res = messaging::decodeMessage(sender, body);
    if (message_res.has_error()) {
      SL_WARN(logger_, "Message {:0x} rejected: {}", id, message_res.error());
      if (message_res.error()
          == messaging::MessagingError::UNKNOWN_MESSAGE_KIND) {
        return HubError::UNEXPECTED_MESSAGE_KIND;
      }
      return HubError::MALFORMED_MESSAGE;
    }
    auto &message = message_res.value();
    if (message.kind != MessageKind::DEPOSIT) {
      SL_WARN(logger_, "Message {:0x} is not a deposit", id);
      return HubError::UNEXPECTED_MESSAGE_KIND;
    }
    if (message.origin_domain != origin_domain) {
      SL_WARN(logger_,
              "Message {:0x} claims origin {} but came from {}",
              id,
              message.origin_domain,
              origin_domain);
      return HubError::UNTRUSTED_ORIGIN;
    }
    if (isZero(message.recipient)) {
      return HubError::MALFORMED_MESSAGE;
    }

    return applyDeposit(id, message);
  }

  outcome::result<void> HubLedgerImpl::applyDeposit(const MessageId &id,
                                                    const Message &message) {
    if (not token_registry_) {
      SL_WARN(logger_, "Message {:0x}: token registry is not set", id);
      return HubError::TOKEN_REGISTRY_NOT_SET;
    }

    auto synthetic = token_registry_->getSyntheticToken(
        message.origin_domain, message.token, config_->local_domain);
    if (isZero(synthetic)) {
      if (policy_ == UnmappedTokenPolicy::ABSORB) {
        return absorb(id, message);
      }
      SL_WARN(logger_,
              "Message {:0x}: token {:0x} of domain {} is not mapped, "
              "left for retry",
              id,
              message.token,
              message.origin_domain);
      return HubError::UNMAPPED_TOKEN;
    }

    auto asset = assets_->getSyntheticAsset(synthetic);
    if (not asset) {
      SL_WARN(logger_,
              "Message {:0x}: synthetic asset {:0x} is unknown",
              id,
              synthetic);
      return HubError::UNKNOWN_ASSET;
    }

    auto balance_key = storage::balanceKey(message.recipient, synthetic);
    auto count_key = storage::processedCountKey(message.recipient);
    OUTCOME_TRY(balance, storage::readAmount(*space_, balance_key));
    OUTCOME_TRY(count, storage::readU64(*space_, count_key));
    if (addOverflows(balance, message.amount)) {
      return HubError::BALANCE_OVERFLOW;
    }

    OUTCOME_TRY(asset->mint(address_, address_, message.amount));

    auto batch = space_->batch();
    auto commit_res = [&]() -> outcome::result<void> {
      OUTCOME_TRY(batch->put(storage::processedMessageKey(id),
                             qtils::ByteVec{kProcessedMark}));
      OUTCOME_TRY(batch->put(balance_key,
                             storage::encodeAmount(balance + message.amount)));
      OUTCOME_TRY(batch->put(count_key, storage::encodeU64(count + 1)));
      return batch->commit();
    }();
    if (commit_res.has_error()) {
      SL_ERROR(logger_,
               "Can't commit credit of message {:0x}: {}",
               id,
               commit_res.error());
      if (auto res = asset->burn(address_, address_, message.amount);
          res.has_error()) {
        SL_CRITICAL(logger_,
                    "Can't burn back {} of {:0x}: {}",
                    message.amount,
                    synthetic,
                    res.error());
      }
      return commit_res.as_failure();
    }

    SL_INFO(logger_,
            "Deposit {:0x}: credited {} of {:0x} to {:0x}",
            id,
            message.amount,
            synthetic,
            message.recipient);
    return outcome::success();
  }

  outcome::result<void> HubLedgerImpl::absorb(const MessageId &id,
                                              const Message &message) {
    OUTCOME_TRY(space_->put(storage::processedMessageKey(id),
                            qtils::ByteVec{kProcessedMark}));
    SL_WARN(logger_,
            "ALERT: message {:0x} absorbed without credit: token {:0x} of "
            "domain {} is not mapped; {} for {:0x} needs manual "
            "reconciliation",
            id,
            message.token,
            message.origin_domain,
            message.amount,
            message.recipient);
    return outcome::success();
  }

  outcome::result<MessageId> HubLedgerImpl::requestWithdraw(
      const Address &caller,
      const Address &synthetic,
      const Amount &amount,
      Domain target_domain) {
    std::lock_guard lock{mutex_};

    if (not config_.has_value() or not transport_) {
      return HubError::NOT_CONFIGURED;
    }
    if (amount == 0) {
      return HubError::ZERO_AMOUNT;
    }
    auto endpoint = chain_registry_->getChainEndpoint(target_domain);
    if (not endpoint.has_value() or not endpoint->active) {
      return HubError::UNKNOWN_CHAIN;
    }
    auto asset = assets_->getSyntheticAsset(synthetic);
    if (not asset) {
      return HubError::UNKNOWN_ASSET;
    }
    if (assets_->getSourceDomain(synthetic) != target_domain) {
      return HubError::WRONG_DESTINATION_CHAIN;
    }

    auto balance_key = storage::balanceKey(caller, synthetic);
    auto nonce_key = storage::nonceKey(caller);
    OUTCOME_TRY(balance, storage::readAmount(*space_, balance_key));
    if (balance < amount) {
      SL_DEBUG(logger_,
               "Withdrawal of {} of {:0x} by {:0x} rejected, balance {}",
               amount,
               synthetic,
               caller,
               balance);
      return HubError::INSUFFICIENT_BALANCE;
    }
    OUTCOME_TRY(nonce, storage::readU64(*space_, nonce_key));

    OUTCOME_TRY(body,
                messaging::encodeBody(Message{
                    .kind = MessageKind::RELEASE,
                    .origin_domain = config_->local_domain,
                    .sender = address_,
                    .token = synthetic,
                    .recipient = caller,
                    .amount = amount,
                    .sequence = nonce,
                }));

    auto batch = space_->batch();
    OUTCOME_TRY(batch->put(balance_key, storage::encodeAmount(balance - amount)));
    OUTCOME_TRY(batch->put(nonce_key, storage::encodeU64(nonce + 1)));
    OUTCOME_TRY(batch->commit());

    if (auto res = asset->burn(address_, address_, amount); res.has_error()) {
      SL_ERROR(logger_,
               "Can't burn {} of {:0x} for withdrawal: {}",
               amount,
               synthetic,
               res.error());
      restoreWithdrawal(caller, synthetic, balance, nonce);
      return res.as_failure();
    }

    auto id_res = transport_->dispatch(
        address_, target_domain, endpoint->gateway, std::move(body));
    if (id_res.has_error()) {
      SL_WARN(logger_,
              "Dispatch of withdrawal for {:0x} failed, reverting: {}",
              caller,
              id_res.error());
      if (auto res = asset->mint(address_, address_, amount);
          res.has_error()) {
        SL_CRITICAL(logger_,
                    "Can't mint back {} of {:0x}: {}",
                    amount,
                    synthetic,
                    res.error());
      }
      restoreWithdrawal(caller, synthetic, balance, nonce);
      return id_res.as_failure();
    }

    SL_INFO(logger_,
            "Withdrawal {:0x}: {} of {:0x} by {:0x} to domain {}",
            id_res.value(),
            amount,
            synthetic,
            caller,
            target_domain);
    return id_res.value();
  }

  void HubLedgerImpl::restoreWithdrawal(const Address &user,
                                        const Address &synthetic,
                                        const Amount &balance,
                                        uint64_t nonce) {
    auto batch = space_->batch();
    auto res = [&]() -> outcome::result<void> {
      OUTCOME_TRY(batch->put(storage::balanceKey(user, synthetic),
                             storage::encodeAmount(balance)));
      OUTCOME_TRY(
          batch->put(storage::nonceKey(user), storage::encodeU64(nonce)));
      return batch->commit();
    }();
    if (res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't restore ledger of {:0x} in {:0x}: {}",
                  user,
                  synthetic,
                  res.error());
    }
  }

  outcome::result<void> HubLedgerImpl::setAuthorizedOperator(
      const Address &caller, const Address &op, bool enabled) {
    OUTCOME_TRY(onlyOwner(caller));
    if (isZero(op)) {
      return HubError::ZERO_ADDRESS;
    }
    std::lock_guard lock{mutex_};
    if (enabled) {
      operators_.insert(op);
    } else {
      operators_.erase(op);
    }
    SL_INFO(logger_,
            "Operator {:0x} {}",
            op,
            enabled ? "authorized" : "deauthorized");
    return outcome::success();
  }

  bool HubLedgerImpl::isAuthorizedOperator(const Address &op) const {
    std::lock_guard lock{mutex_};
    return operators_.contains(op);
  }

  outcome::result<void> HubLedgerImpl::transferBalance(const Address &caller,
                                                       const Address &from,
                                                       const Address &to,
                                                       const Address &asset,
                                                       const Amount &amount) {
    std::lock_guard lock{mutex_};
    if (not operators_.contains(caller)) {
      return HubError::UNAUTHORIZED;
    }
    if (amount == 0) {
      return HubError::ZERO_AMOUNT;
    }
    if (isZero(from) or isZero(to)) {
      return HubError::ZERO_ADDRESS;
    }
    if (from == to) {
      return outcome::success();
    }

    auto from_key = storage::balanceKey(from, asset);
    auto to_key = storage::balanceKey(to, asset);
    OUTCOME_TRY(from_balance, storage::readAmount(*space_, from_key));
    OUTCOME_TRY(to_balance, storage::readAmount(*space_, to_key));
    if (from_balance < amount) {
      return HubError::INSUFFICIENT_BALANCE;
    }
    if (addOverflows(to_balance, amount)) {
      return HubError::BALANCE_OVERFLOW;
    }

    auto batch = space_->batch();
    OUTCOME_TRY(batch->put(from_key, storage::encodeAmount(from_balance - amount)));
    OUTCOME_TRY(batch->put(to_key, storage::encodeAmount(to_balance + amount)));
    OUTCOME_TRY(batch->commit());

    SL_DEBUG(logger_,
             "Operator {:0x} moved {} of {:0x} from {:0x} to {:0x}",
             caller,
             amount,
             asset,
             from,
             to);
    return outcome::success();
  }

  outcome::result<void> HubLedgerImpl::setChainEndpoint(
      const Address &caller, Domain domain, const Address &gateway) {
    OUTCOME_TRY(onlyOwner(caller));
    return chain_registry_->setChainEndpoint(caller, domain, gateway);
  }

  outcome::result<void> HubLedgerImpl::setTokenRegistry(
      const Address &caller,
      std::shared_ptr<registry::TokenRegistry> token_registry) {
    OUTCOME_TRY(onlyOwner(caller));
    if (not token_registry) {
      return HubError::ZERO_ADDRESS;
    }
    std::lock_guard lock{mutex_};
    token_registry_ = std::move(token_registry);
    SL_INFO(logger_, "Token registry set");
    return outcome::success();
  }

  outcome::result<void> HubLedgerImpl::updateCrossChainConfig(
      const Address &caller,
      std::shared_ptr<messaging::MessageTransport> transport,
      Domain local_domain) {
    OUTCOME_TRY(onlyOwner(caller));
    if (not transport or local_domain == kInvalidDomain) {
      return HubError::INVALID_CONFIG;
    }
    std::lock_guard lock{mutex_};
    config_ = CrossChainConfig{
        .transport = transport->address(),
        .local_domain = local_domain,
    };
    transport_ = std::move(transport);
    SL_INFO(logger_,
            "Cross-chain config updated: domain {}, transport {:0x}",
            local_domain,
            config_->transport);
    return outcome::success();
  }

  outcome::result<void> HubLedgerImpl::setUnmappedTokenPolicy(
      const Address &caller, UnmappedTokenPolicy policy) {
    OUTCOME_TRY(onlyOwner(caller));
    std::lock_guard lock{mutex_};
    policy_ = policy;
    SL_INFO(logger_, "Unmapped tokens policy set to {}", policyName(policy));
    return outcome::success();
  }

  outcome::result<Amount> HubLedgerImpl::getBalance(
      const Address &user, const Address &asset) const {
    std::lock_guard lock{mutex_};
    return storage::readAmount(*space_, storage::balanceKey(user, asset));
  }

  outcome::result<bool> HubLedgerImpl::isMessageProcessed(
      const MessageId &id) const {
    std::lock_guard lock{mutex_};
    return space_->contains(storage::processedMessageKey(id));
  }

  std::optional<ChainEndpoint> HubLedgerImpl::getChainEndpoint(
      Domain domain) const {
    return chain_registry_->getChainEndpoint(domain);
  }

  std::optional<CrossChainConfig> HubLedgerImpl::getCrossChainConfig() const {
    std::lock_guard lock{mutex_};
    return config_;
  }

  outcome::result<uint64_t> HubLedgerImpl::getUserProcessedCount(
      const Address &user) const {
    std::lock_guard lock{mutex_};
    return storage::readU64(*space_, storage::processedCountKey(user));
  }

  outcome::result<uint64_t> HubLedgerImpl::getUserNonce(
      const Address &user) const {
    std::lock_guard lock{mutex_};
    return storage::readU64(*space_, storage::nonceKey(user));
  }

  UnmappedTokenPolicy HubLedgerImpl::getUnmappedTokenPolicy() const {
    std::lock_guard lock{mutex_};
    return policy_;
  }

}  // namespace bridge::hub
