/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "token/impl/balance_book.hpp"

#include "storage/storage_error.hpp"
#include "token/token_error.hpp"

namespace bridge::token {

  Amount BalanceBook::balanceOf(const Address &account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? Amount{0} : it->second;
  }

  Amount BalanceBook::allowance(const Address &owner,
                                const Address &spender) const {
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? Amount{0} : it->second;
  }

  outcome::result<void> BalanceBook::transfer(const Address &from,
                                              const Address &to,
                                              const Amount &amount) {
    if (isZero(from) or isZero(to)) {
      return TokenError::ZERO_ADDRESS;
    }
    auto from_balance = balanceOf(from);
    if (from_balance < amount) {
      return TokenError::INSUFFICIENT_BALANCE;
    }
    if (from == to) {
      return outcome::success();
    }
    // cannot overflow: sum of balances never exceeds total supply
    setBalance(from, from_balance - amount);
    setBalance(to, balanceOf(to) + amount);
    return outcome::success();
  }

  outcome::result<void> BalanceBook::approve(const Address &owner,
                                             const Address &spender,
                                             const Amount &amount) {
    if (isZero(owner) or isZero(spender)) {
      return TokenError::ZERO_ADDRESS;
    }
    if (amount == 0) {
      allowances_.erase({owner, spender});
    } else {
      allowances_[{owner, spender}] = amount;
    }
    return outcome::success();
  }

  outcome::result<void> BalanceBook::spendAllowance(const Address &owner,
                                                    const Address &spender,
                                                    const Amount &amount) {
    auto current = allowance(owner, spender);
    if (current == kMaxAmount) {
      return outcome::success();
    }
    if (current < amount) {
      return TokenError::INSUFFICIENT_ALLOWANCE;
    }
    return approve(owner, spender, current - amount);
  }

  outcome::result<void> BalanceBook::mint(const Address &to,
                                          const Amount &amount) {
    if (isZero(to)) {
      return TokenError::ZERO_ADDRESS;
    }
    if (addOverflows(total_supply_, amount)) {
      return TokenError::SUPPLY_OVERFLOW;
    }
    total_supply_ += amount;
    setBalance(to, balanceOf(to) + amount);
    return outcome::success();
  }

  outcome::result<void> BalanceBook::burn(const Address &from,
                                          const Amount &amount) {
    if (isZero(from)) {
      return TokenError::ZERO_ADDRESS;
    }
    auto balance = balanceOf(from);
    if (balance < amount) {
      return TokenError::INSUFFICIENT_BALANCE;
    }
    total_supply_ -= amount;
    setBalance(from, balance - amount);
    return outcome::success();
  }

  BalanceSnapshot BalanceBook::snapshot() const {
    BalanceSnapshot snapshot;
    snapshot.total_supply = toWord(total_supply_);
    for (auto &[account, amount] : balances_) {
      snapshot.balances.data().push_back(
          BalanceEntry{.account = account, .amount = toWord(amount)});
    }
    for (auto &[key, amount] : allowances_) {
      snapshot.allowances.data().push_back(AllowanceEntry{
          .owner = key.first,
          .spender = key.second,
          .amount = toWord(amount),
      });
    }
    return snapshot;
  }

  outcome::result<BalanceBook> BalanceBook::restore(
      const BalanceSnapshot &snapshot) {
    BalanceBook book;
    book.total_supply_ = fromWord(snapshot.total_supply);
    Amount sum{0};
    for (auto &entry : snapshot.balances.data()) {
      auto amount = fromWord(entry.amount);
      if (isZero(entry.account) or amount == 0 or addOverflows(sum, amount)
          or not book.balances_.emplace(entry.account, amount).second) {
        return storage::StorageError::CORRUPTION;
      }
      sum += amount;
    }
    if (sum != book.total_supply_) {
      return storage::StorageError::CORRUPTION;
    }
    for (auto &entry : snapshot.allowances.data()) {
      book.allowances_[{entry.owner, entry.spender}] = fromWord(entry.amount);
    }
    return book;
  }

  void BalanceBook::setBalance(const Address &account, const Amount &amount) {
    if (amount == 0) {
      balances_.erase(account);
    } else {
      balances_[account] = amount;
    }
  }

}  // namespace bridge::token
