/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>

#include "access/ownable.hpp"
#include "log/logger.hpp"
#include "storage/spaced_storage.hpp"
#include "token/impl/synthetic_asset.hpp"
#include "token/synthetic_token_factory.hpp"

namespace bridge::token {

  /**
   * Keeps the created assets in the SyntheticAssets storage space: the
   * directory of assets and the balance book of each one. Assets created
   * before a restart are available again after it.
   */
  class SyntheticTokenFactoryImpl final : public SyntheticTokenFactory,
                                          public access::Ownable {
   public:
    /// Largest precision a 256-bit amount can carry
    static constexpr uint8_t kMaxDecimals = 77;

    /// Layout version of the synthetic assets storage space
    static constexpr uint64_t kSchemaVersion = 1;

    /**
     * @param minter the hub ledger, the only account allowed to mint and
     * burn the created assets
     * @throws std::system_error if stored assets can not be loaded
     */
    SyntheticTokenFactoryImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                              qtils::SharedRef<storage::SpacedStorage> storage,
                              const Address &owner,
                              const Address &minter);

    outcome::result<Address> createSyntheticToken(
        const Address &caller,
        Domain source_domain,
        const Address &source_token,
        std::string name,
        std::string symbol,
        uint8_t decimals) override;

    outcome::result<Address> replaceSyntheticToken(
        const Address &caller,
        Domain source_domain,
        const Address &source_token,
        std::string name,
        std::string symbol,
        uint8_t decimals) override;

    std::optional<Address> getSyntheticToken(
        Domain source_domain, const Address &source_token) const override;

    std::optional<TokenInfo> getTokenInfo(
        const Address &synthetic) const override;

    std::vector<TokenInfo> getAllSyntheticTokens() const override;

    std::shared_ptr<MintableToken> getSyntheticAsset(
        const Address &synthetic) const override;

    std::optional<Domain> getSourceDomain(
        const Address &synthetic) const override;

    static Address deriveAddress(Domain source_domain,
                                 const Address &source_token,
                                 uint32_t generation);

   private:
    using SourceKey = std::pair<Domain, Address>;

    outcome::result<void> load();

    /// Validates, stores and registers a new asset; needs the lock
    outcome::result<Address> create(Domain source_domain,
                                    const Address &source_token,
                                    uint32_t generation,
                                    std::string name,
                                    std::string symbol,
                                    uint8_t decimals);

    void add(std::shared_ptr<SyntheticAsset> asset);

    log::Logger logger_;
    qtils::SharedRef<log::LoggingSystem> logsys_;
    std::shared_ptr<storage::BufferStorage> space_;
    const Address minter_;

    mutable std::mutex mutex_;
    std::map<Address, std::shared_ptr<SyntheticAsset>> assets_;
    std::map<SourceKey, Address> latest_;
    /// creation order, also the index of the stored record
    std::vector<Address> order_;
  };

}  // namespace bridge::token
