/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>
#include <set>

#include "access/ownable.hpp"
#include "gateway/source_gateway.hpp"
#include "log/logger.hpp"
#include "storage/spaced_storage.hpp"

namespace bridge::gateway {

  class SourceGatewayImpl final : public SourceGateway,
                                  public access::Ownable {
   public:
    /// Layout version of the gateway storage space
    static constexpr uint64_t kSchemaVersion = 1;

    SourceGatewayImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                      qtils::SharedRef<storage::SpacedStorage> storage,
                      const Address &owner,
                      const Address &address);

    const Address &address() const override {
      return address_;
    }

    outcome::result<MessageId> deposit(const Address &caller,
                                       const Address &token,
                                       const Amount &amount,
                                       const Address &recipient) override;

    outcome::result<void> handle(const Address &caller,
                                 Domain origin_domain,
                                 const Address &sender,
                                 qtils::ByteView body) override;

    outcome::result<void> addWhitelistedToken(
        const Address &caller,
        std::shared_ptr<token::FungibleToken> token) override;

    outcome::result<void> removeWhitelistedToken(
        const Address &caller, const Address &token) override;

    outcome::result<void> setTokenMapping(const Address &caller,
                                          const Address &local_token,
                                          const Address &synthetic) override;

    outcome::result<void> updateCrossChainConfig(
        const Address &caller,
        std::shared_ptr<messaging::MessageTransport> transport,
        Domain local_domain,
        Domain destination_domain,
        const Address &destination_gateway) override;

    bool isTokenWhitelisted(const Address &token) const override;

    std::vector<Address> getWhitelistedTokens() const override;

    Address getTokenMapping(const Address &local_token) const override;

    Address getReverseTokenMapping(const Address &synthetic) const override;

    std::optional<CrossChainConfig> getCrossChainConfig() const override;

    outcome::result<bool> isMessageProcessed(
        const MessageId &id) const override;

    outcome::result<uint64_t> getUserNonce(
        const Address &recipient) const override;

    Amount getCustodyBalance(const Address &token) const override;

   private:
    /// Returns pulled collateral back to the depositor
    void refund(token::FungibleToken &token,
                const Address &depositor,
                const Amount &amount);

    log::Logger logger_;
    std::shared_ptr<storage::BufferStorage> space_;
    const Address address_;

    mutable std::mutex mutex_;
    std::shared_ptr<messaging::MessageTransport> transport_;
    std::optional<CrossChainConfig> config_;
    std::map<Address, std::shared_ptr<token::FungibleToken>> tokens_;
    std::set<Address> whitelist_;
    std::map<Address, Address> local_to_synthetic_;
    std::map<Address, Address> synthetic_to_local_;
  };

}  // namespace bridge::gateway
