/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "token/impl/basic_token.hpp"

#include <qtils/error_throw.hpp>

namespace bridge::token {

  BasicToken::BasicToken(qtils::SharedRef<log::LoggingSystem> logsys,
                         Params params)
      : logger_(logsys->getLogger("BasicToken", "token")),
        params_(std::move(params)) {
    if (params_.initial_supply > 0) {
      if (auto res = book_.mint(params_.holder, params_.initial_supply);
          res.has_error()) {
        qtils::raise(res.error());
      }
    }
    SL_VERBOSE(logger_,
               "Token {} ({:0x}) created, supply {}",
               params_.symbol,
               params_.address,
               params_.initial_supply);
  }

  Amount BasicToken::totalSupply() const {
    std::lock_guard lock{mutex_};
    return book_.totalSupply();
  }

  Amount BasicToken::balanceOf(const Address &account) const {
    std::lock_guard lock{mutex_};
    return book_.balanceOf(account);
  }

  Amount BasicToken::allowance(const Address &owner,
                               const Address &spender) const {
    std::lock_guard lock{mutex_};
    return book_.allowance(owner, spender);
  }

  outcome::result<void> BasicToken::transfer(const Address &caller,
                                             const Address &to,
                                             const Amount &amount) {
    std::lock_guard lock{mutex_};
    return book_.transfer(caller, to, amount);
  }

  outcome::result<void> BasicToken::approve(const Address &caller,
                                            const Address &spender,
                                            const Amount &amount) {
    std::lock_guard lock{mutex_};
    return book_.approve(caller, spender, amount);
  }

  outcome::result<void> BasicToken::transferFrom(const Address &caller,
                                                 const Address &from,
                                                 const Address &to,
                                                 const Amount &amount) {
    std::lock_guard lock{mutex_};
    if (book_.balanceOf(from) < amount) {
      return TokenError::INSUFFICIENT_BALANCE;
    }
    OUTCOME_TRY(book_.spendAllowance(from, caller, amount));
    return book_.transfer(from, to, amount);
  }

}  // namespace bridge::token
