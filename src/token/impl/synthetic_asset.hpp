/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>

#include "log/logger.hpp"
#include "storage/buffer_storage.hpp"
#include "token/impl/balance_book.hpp"
#include "token/mintable_token.hpp"
#include "types/domain.hpp"

namespace bridge::token {

  /**
   * Hub-side representation of a source-network token. Supply changes only
   * through the minter; there is no other privileged role.
   *
   * The balance book is written to the storage space on every change and
   * read back on construction, so supply and custody survive a restart.
   */
  class SyntheticAsset final : public MintableToken {
   public:
    struct Params {
      Address address{};
      std::string name;
      std::string symbol;
      uint8_t decimals = 18;
      Address minter{};
      Domain source_domain = kInvalidDomain;
      Address source_token{};
      /// number of synthetics created for the source token before this one
      uint32_t generation = 0;
    };

    /// @throws std::system_error if the stored book is unreadable
    SyntheticAsset(qtils::SharedRef<log::LoggingSystem> logsys,
                   std::shared_ptr<storage::BufferStorage> space,
                   Params params);

    const Address &address() const override {
      return params_.address;
    }

    const std::string &name() const override {
      return params_.name;
    }

    const std::string &symbol() const override {
      return params_.symbol;
    }

    uint8_t decimals() const override {
      return params_.decimals;
    }

    const Address &minter() const override {
      return params_.minter;
    }

    Domain sourceDomain() const {
      return params_.source_domain;
    }

    const Address &sourceToken() const {
      return params_.source_token;
    }

    uint32_t generation() const {
      return params_.generation;
    }

    Amount totalSupply() const override;

    Amount balanceOf(const Address &account) const override;

    Amount allowance(const Address &owner,
                     const Address &spender) const override;

    outcome::result<void> transfer(const Address &caller,
                                   const Address &to,
                                   const Amount &amount) override;

    outcome::result<void> approve(const Address &caller,
                                  const Address &spender,
                                  const Amount &amount) override;

    outcome::result<void> transferFrom(const Address &caller,
                                       const Address &from,
                                       const Address &to,
                                       const Amount &amount) override;

    outcome::result<void> mint(const Address &caller,
                               const Address &to,
                               const Amount &amount) override;

    outcome::result<void> burn(const Address &caller,
                               const Address &from,
                               const Amount &amount) override;

   private:
    /// Persists `next` and makes it the current book; needs the lock
    outcome::result<void> commit(BalanceBook next);

    log::Logger logger_;
    std::shared_ptr<storage::BufferStorage> space_;
    const Params params_;
    const qtils::ByteVec book_key_;

    mutable std::mutex mutex_;
    BalanceBook book_;
  };

}  // namespace bridge::token
