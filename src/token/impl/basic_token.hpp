/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>

#include "log/logger.hpp"
#include "token/fungible_token.hpp"
#include "token/impl/balance_book.hpp"

namespace bridge::token {

  /**
   * Fixed-supply token: the whole supply is assigned to `holder` on
   * creation. Stands for a source-side collateral token.
   */
  class BasicToken final : public FungibleToken {
   public:
    struct Params {
      Address address{};
      std::string name;
      std::string symbol;
      uint8_t decimals = 18;
      Address holder{};
      Amount initial_supply;
    };

    BasicToken(qtils::SharedRef<log::LoggingSystem> logsys, Params params);

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

   private:
    log::Logger logger_;
    const Params params_;

    mutable std::mutex mutex_;
    BalanceBook book_;
  };

}  // namespace bridge::token
