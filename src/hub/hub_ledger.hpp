/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include "messaging/message_recipient.hpp"
#include "messaging/message_transport.hpp"
#include "registry/token_registry.hpp"
#include "types/chain_endpoint.hpp"
#include "types/cross_chain_config.hpp"
#include "types/message.hpp"

namespace bridge::hub {

  /// Treatment of a deposit whose token has no synthetic mapping
  enum class UnmappedTokenPolicy : uint8_t {
    /// Fail the delivery; the message stays retryable
    REJECT,
    /// Mark the message processed without credit and raise an alert
    ABSORB,
  };

  /**
   * Hub end of the bridge. Credits users for deposits made on source
   * networks, keeps the per-user ledger of synthetic assets and originates
   * withdrawals back to the source networks.
   *
   * Inbound DEPOSIT messages arrive through MessageRecipient::handle.
   */
  class HubLedger : public messaging::MessageRecipient {
   public:
    /// Identity of the ledger: synthetic custody account and message sender
    virtual const Address &address() const = 0;

    /**
     * Debits `amount` of `synthetic` from caller's ledger balance, burns it
     * and dispatches a RELEASE to the gateway of `target_domain`. Either
     * all of it happens or nothing does.
     * @returns id of the dispatched message
     */
    virtual outcome::result<MessageId> requestWithdraw(
        const Address &caller,
        const Address &synthetic,
        const Amount &amount,
        Domain target_domain) = 0;

    // -- operator --

    /// Grants or revokes the right to move ledger balances between users
    virtual outcome::result<void> setAuthorizedOperator(
        const Address &caller, const Address &op, bool enabled) = 0;

    virtual bool isAuthorizedOperator(const Address &op) const = 0;

    virtual outcome::result<void> transferBalance(const Address &caller,
                                                  const Address &from,
                                                  const Address &to,
                                                  const Address &asset,
                                                  const Amount &amount) = 0;

    // -- admin --

    /// Registers or replaces the trusted gateway of `domain`
    virtual outcome::result<void> setChainEndpoint(const Address &caller,
                                                   Domain domain,
                                                   const Address &gateway) = 0;

    virtual outcome::result<void> setTokenRegistry(
        const Address &caller,
        std::shared_ptr<registry::TokenRegistry> token_registry) = 0;

    /// May be called any number of times; the latest config wins
    virtual outcome::result<void> updateCrossChainConfig(
        const Address &caller,
        std::shared_ptr<messaging::MessageTransport> transport,
        Domain local_domain) = 0;

    virtual outcome::result<void> setUnmappedTokenPolicy(
        const Address &caller, UnmappedTokenPolicy policy) = 0;

    // -- read --

    virtual outcome::result<Amount> getBalance(const Address &user,
                                               const Address &asset) const = 0;

    virtual outcome::result<bool> isMessageProcessed(
        const MessageId &id) const = 0;

    virtual std::optional<ChainEndpoint> getChainEndpoint(
        Domain domain) const = 0;

    virtual std::optional<CrossChainConfig> getCrossChainConfig() const = 0;

    /// Number of deposits credited to `user`; informational only
    virtual outcome::result<uint64_t> getUserProcessedCount(
        const Address &user) const = 0;

    /// Number of withdrawals requested by `user`
    virtual outcome::result<uint64_t> getUserNonce(
        const Address &user) const = 0;

    virtual UnmappedTokenPolicy getUnmappedTokenPolicy() const = 0;
  };

}  // namespace bridge::hub
