/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <set>

#include "access/ownable.hpp"
#include "hub/hub_ledger.hpp"
#include "log/logger.hpp"
#include "registry/chain_registry.hpp"
#include "storage/spaced_storage.hpp"
#include "token/synthetic_asset_provider.hpp"

namespace bridge::hub {

  class HubLedgerImpl final : public HubLedger, public access::Ownable {
   public:
    /// Layout version of the ledger storage space
    static constexpr uint64_t kSchemaVersion = 1;

    HubLedgerImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                  qtils::SharedRef<storage::SpacedStorage> storage,
                  qtils::SharedRef<registry::ChainRegistry> chain_registry,
                  qtils::SharedRef<token::SyntheticAssetProvider> assets,
                  const Address &owner,
                  const Address &address,
                  UnmappedTokenPolicy policy = UnmappedTokenPolicy::REJECT);

    const Address &address() const override {
      return address_;
    }

    outcome::result<void> handle(const Address &caller,
                                 Domain origin_domain,
                                 const Address &sender,
                                 qtils::ByteView body) override;

    outcome::result<MessageId> requestWithdraw(const Address &caller,
                                               const Address &synthetic,
                                               const Amount &amount,
                                               Domain target_domain) override;

    outcome::result<void> setAuthorizedOperator(const Address &caller,
                                                const Address &op,
                                                bool enabled) override;

    bool isAuthorizedOperator(const Address &op) const override;

    outcome::result<void> transferBalance(const Address &caller,
                                          const Address &from,
                                          const Address &to,
                                          const Address &asset,
                                          const Amount &amount) override;

    outcome::result<void> setChainEndpoint(const Address &caller,
                                           Domain domain,
                                           const Address &gateway) override;

    outcome::result<void> setTokenRegistry(
        const Address &caller,
        std::shared_ptr<registry::TokenRegistry> token_registry) override;

    outcome::result<void> updateCrossChainConfig(
        const Address &caller,
        std::shared_ptr<messaging::MessageTransport> transport,
        Domain local_domain) override;

    outcome::result<void> setUnmappedTokenPolicy(
        const Address &caller, UnmappedTokenPolicy policy) override;

    outcome::result<Amount> getBalance(const Address &user,
                                       const Address &asset) const override;

    outcome::result<bool> isMessageProcessed(
        const MessageId &id) const override;

    std::optional<ChainEndpoint> getChainEndpoint(
        Domain domain) const override;

    std::optional<CrossChainConfig> getCrossChainConfig() const override;

    outcome::result<uint64_t> getUserProcessedCount(
        const Address &user) const override;

    outcome::result<uint64_t> getUserNonce(const Address &user) const override;

    UnmappedTokenPolicy getUnmappedTokenPolicy() const override;

   private:
    /// Validated inbound deposit; needs the lock
    outcome::result<void> applyDeposit(const MessageId &id,
                                       const Message &message);

    /// Marks the message processed with no credit; needs the lock
    outcome::result<void> absorb(const MessageId &id, const Message &message);

    /**
     * Restores ledger entries changed by a failed withdrawal; needs the
     * lock
     */
    void restoreWithdrawal(const Address &user,
                           const Address &synthetic,
                           const Amount &balance,
                           uint64_t nonce);

    log::Logger logger_;
    std::shared_ptr<storage::BufferStorage> space_;
    qtils::SharedRef<registry::ChainRegistry> chain_registry_;
    qtils::SharedRef<token::SyntheticAssetProvider> assets_;
    const Address address_;

    mutable std::mutex mutex_;
    std::shared_ptr<registry::TokenRegistry> token_registry_;
    std::shared_ptr<messaging::MessageTransport> transport_;
    std::optional<CrossChainConfig> config_;
    UnmappedTokenPolicy policy_;
    std::set<Address> operators_;
  };

}  // namespace bridge::hub
