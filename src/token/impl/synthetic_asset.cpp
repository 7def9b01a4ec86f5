/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "token/impl/synthetic_asset.hpp"

#include <qtils/error_throw.hpp>

#include "serde/serialization.hpp"
#include "storage/keys.hpp"
#include "storage/storage_error.hpp"
#include "token/token_error.hpp"

namespace bridge::token {

  SyntheticAsset::SyntheticAsset(qtils::SharedRef<log::LoggingSystem> logsys,
                                 std::shared_ptr<storage::BufferStorage> space,
                                 Params params)
      : logger_(logsys->getLogger("SyntheticAsset", "token")),
        space_(std::move(space)),
        params_(std::move(params)),
        book_key_(storage::assetBookKey(params_.address)) {
    if (isZero(params_.address) or isZero(params_.minter)) {
      qtils::raise(TokenError::ZERO_ADDRESS);
    }
    auto stored = space_->tryGet(book_key_);
    if (stored.has_error()) {
      qtils::raise(stored.error());
    }
    if (stored.value().has_value()) {
      auto snapshot = decode<BalanceSnapshot>(stored.value()->view());
      if (snapshot.has_error()) {
        SL_CRITICAL(logger_,
                    "Balance book of {:0x} is unreadable",
                    params_.address);
        qtils::raise(storage::StorageError::CORRUPTION);
      }
      auto book = BalanceBook::restore(snapshot.value());
      if (book.has_error()) {
        SL_CRITICAL(logger_,
                    "Balance book of {:0x} is inconsistent",
                    params_.address);
        qtils::raise(book.error());
      }
      book_ = std::move(book.value());
      SL_DEBUG(logger_,
               "Asset {} restored, supply {}",
               params_.symbol,
               book_.totalSupply());
    }
  }

  outcome::result<void> SyntheticAsset::commit(BalanceBook next) {
    OUTCOME_TRY(encoded, encode(next.snapshot()));
    if (auto res = space_->put(book_key_, std::move(encoded));
        res.has_error()) {
      SL_ERROR(logger_,
               "Can't store balance book of {:0x}: {}",
               params_.address,
               res.error());
      return res.as_failure();
    }
    book_ = std::move(next);
    return outcome::success();
  }

  Amount SyntheticAsset::totalSupply() const {
    std::lock_guard lock{mutex_};
    return book_.totalSupply();
  }

  Amount SyntheticAsset::balanceOf(const Address &account) const {
    std::lock_guard lock{mutex_};
    return book_.balanceOf(account);
  }

  Amount SyntheticAsset::allowance(const Address &owner,
                                   const Address &spender) const {
    std::lock_guard lock{mutex_};
    return book_.allowance(owner, spender);
  }

  outcome::result<void> SyntheticAsset::transfer(const Address &caller,
                                                 const Address &to,
                                                 const Amount &amount) {
    std::lock_guard lock{mutex_};
    auto next = book_;
    OUTCOME_TRY(next.transfer(caller, to, amount));
    return commit(std::move(next));
  }

  outcome::result<void> SyntheticAsset::approve(const Address &caller,
                                                const Address &spender,
                                                const Amount &amount) {
    std::lock_guard lock{mutex_};
    auto next = book_;
    OUTCOME_TRY(next.approve(caller, spender, amount));
    return commit(std::move(next));
  }

  outcome::result<void> SyntheticAsset::transferFrom(const Address &caller,
                                                     const Address &from,
                                                     const Address &to,
                                                     const Amount &amount) {
    std::lock_guard lock{mutex_};
    if (book_.balanceOf(from) < amount) {
      return TokenError::INSUFFICIENT_BALANCE;
    }
    auto next = book_;
    OUTCOME_TRY(next.spendAllowance(from, caller, amount));
    OUTCOME_TRY(next.transfer(from, to, amount));
    return commit(std::move(next));
  }

  outcome::result<void> SyntheticAsset::mint(const Address &caller,
                                             const Address &to,
                                             const Amount &amount) {
    if (caller != params_.minter) {
      SL_WARN(logger_,
              "Rejected mint of {} {} by {:0x}",
              amount,
              params_.symbol,
              caller);
      return TokenError::UNAUTHORIZED;
    }
    std::lock_guard lock{mutex_};
    auto next = book_;
    OUTCOME_TRY(next.mint(to, amount));
    OUTCOME_TRY(commit(std::move(next)));
    SL_TRACE(logger_, "Minted {} {} to {:0x}", amount, params_.symbol, to);
    return outcome::success();
  }

  outcome::result<void> SyntheticAsset::burn(const Address &caller,
                                             const Address &from,
                                             const Amount &amount) {
    if (caller != params_.minter) {
      SL_WARN(logger_,
              "Rejected burn of {} {} by {:0x}",
              amount,
              params_.symbol,
              caller);
      return TokenError::UNAUTHORIZED;
    }
    std::lock_guard lock{mutex_};
    auto next = book_;
    OUTCOME_TRY(next.burn(from, amount));
    OUTCOME_TRY(commit(std::move(next)));
    SL_TRACE(logger_, "Burned {} {} from {:0x}", amount, params_.symbol, from);
    return outcome::success();
  }

}  // namespace bridge::token
