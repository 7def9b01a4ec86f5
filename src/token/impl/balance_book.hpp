/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <utility>

#include <qtils/outcome.hpp>

#include "token/impl/token_records.hpp"
#include "types/address.hpp"
#include "types/amount.hpp"

namespace bridge::token {

  /**
   * Balances and allowances of one token. Not synchronized: the owning
   * token serializes access.
   */
  class BalanceBook {
   public:
    Amount totalSupply() const {
      return total_supply_;
    }

    Amount balanceOf(const Address &account) const;

    Amount allowance(const Address &owner, const Address &spender) const;

    outcome::result<void> transfer(const Address &from,
                                   const Address &to,
                                   const Amount &amount);

    outcome::result<void> approve(const Address &owner,
                                  const Address &spender,
                                  const Amount &amount);

    /// Unlimited (max) allowance is never decreased
    outcome::result<void> spendAllowance(const Address &owner,
                                         const Address &spender,
                                         const Amount &amount);

    outcome::result<void> mint(const Address &to, const Amount &amount);

    outcome::result<void> burn(const Address &from, const Amount &amount);

    BalanceSnapshot snapshot() const;

    /**
     * Rebuilds a book from its snapshot.
     * @returns StorageError::CORRUPTION if the balances do not add up to the
     * total supply
     */
    static outcome::result<BalanceBook> restore(
        const BalanceSnapshot &snapshot);

   private:
    void setBalance(const Address &account, const Amount &amount);

    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
    Amount total_supply_;
  };

}  // namespace bridge::token
