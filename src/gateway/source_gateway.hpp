/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "messaging/message_recipient.hpp"
#include "messaging/message_transport.hpp"
#include "token/fungible_token.hpp"
#include "types/cross_chain_config.hpp"
#include "types/message.hpp"

namespace bridge::gateway {

  /**
   * Source-network end of the bridge. Locks deposited collateral in custody
   * and announces deposits to the hub; releases collateral when the hub
   * reports a withdrawal.
   *
   * Inbound RELEASE messages arrive through MessageRecipient::handle.
   */
  class SourceGateway : public messaging::MessageRecipient {
   public:
    /// Identity of the gateway: custody account and message sender
    virtual const Address &address() const = 0;

    /**
     * Pulls `amount` of `token` from `caller` into custody and dispatches a
     * DEPOSIT crediting `recipient` on the hub. Either both happen or
     * neither does.
     * @returns id of the dispatched message
     */
    virtual outcome::result<MessageId> deposit(const Address &caller,
                                               const Address &token,
                                               const Amount &amount,
                                               const Address &recipient) = 0;

    // -- admin --

    virtual outcome::result<void> addWhitelistedToken(
        const Address &caller, std::shared_ptr<token::FungibleToken> token) = 0;

    /// Stops deposits of the token; releases of its custody still work
    virtual outcome::result<void> removeWhitelistedToken(
        const Address &caller, const Address &token) = 0;

    /**
     * Records that `local_token` is represented by `synthetic` on the hub.
     * Releases of synthetics mapped earlier are still paid in `local_token`.
     */
    virtual outcome::result<void> setTokenMapping(
        const Address &caller,
        const Address &local_token,
        const Address &synthetic) = 0;

    /// May be called any number of times; the latest config wins
    virtual outcome::result<void> updateCrossChainConfig(
        const Address &caller,
        std::shared_ptr<messaging::MessageTransport> transport,
        Domain local_domain,
        Domain destination_domain,
        const Address &destination_gateway) = 0;

    // -- read --

    virtual bool isTokenWhitelisted(const Address &token) const = 0;

    virtual std::vector<Address> getWhitelistedTokens() const = 0;

    /// @returns zero address when unmapped
    virtual Address getTokenMapping(const Address &local_token) const = 0;

    /// @returns zero address when unmapped
    virtual Address getReverseTokenMapping(const Address &synthetic) const = 0;

    virtual std::optional<CrossChainConfig> getCrossChainConfig() const = 0;

    virtual outcome::result<bool> isMessageProcessed(
        const MessageId &id) const = 0;

    /// Number of deposits made in favour of `recipient`
    virtual outcome::result<uint64_t> getUserNonce(
        const Address &recipient) const = 0;

    virtual Amount getCustodyBalance(const Address &token) const = 0;
  };

}  // namespace bridge::gateway
