/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <qtils/outcome.hpp>

#include "types/address.hpp"
#include "types/amount.hpp"

namespace bridge::token {

  /**
   * Fungible token ledger with allowances. The account performing a
   * state-changing call is passed as `caller`.
   */
  class FungibleToken {
   public:
    virtual ~FungibleToken() = default;

    virtual const Address &address() const = 0;

    virtual const std::string &name() const = 0;

    virtual const std::string &symbol() const = 0;

    virtual uint8_t decimals() const = 0;

    virtual Amount totalSupply() const = 0;

    virtual Amount balanceOf(const Address &account) const = 0;

    virtual Amount allowance(const Address &owner,
                             const Address &spender) const = 0;

    /// Moves `amount` of caller's tokens to `to`
    virtual outcome::result<void> transfer(const Address &caller,
                                           const Address &to,
                                           const Amount &amount) = 0;

    /// Sets the allowance of `spender` over caller's tokens
    virtual outcome::result<void> approve(const Address &caller,
                                          const Address &spender,
                                          const Amount &amount) = 0;

    /**
     * Moves `amount` from `from` to `to` using the allowance `from` gave to
     * `caller`
     */
    virtual outcome::result<void> transferFrom(const Address &caller,
                                               const Address &from,
                                               const Address &to,
                                               const Amount &amount) = 0;
  };

}  // namespace bridge::token
