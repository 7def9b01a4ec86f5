/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Stored forms of synthetic asset state.
 */

#pragma once

#include <sszpp/ssz++.hpp>

#include "types/address.hpp"
#include "types/amount.hpp"

namespace bridge::token {

  constexpr size_t kMaxNameLength = 128;
  constexpr size_t kMaxSymbolLength = 32;
  constexpr size_t kMaxBookEntries = 1 << 20;

  /// One asset created by the factory, in order of creation
  struct SyntheticRecord : ssz::ssz_container {
    Address synthetic{};
    uint32_t source_domain = 0;
    Address source_token{};
    uint32_t generation = 0;
    uint8_t decimals = 0;
    ssz::list<uint8_t, kMaxNameLength> name;
    ssz::list<uint8_t, kMaxSymbolLength> symbol;

    SSZ_CONT(synthetic,
             source_domain,
             source_token,
             generation,
             decimals,
             name,
             symbol);
    bool operator==(const SyntheticRecord &) const = default;
  };

  struct BalanceEntry : ssz::ssz_container {
    Address account{};
    AmountWord amount{};

    SSZ_CONT(account, amount);
    bool operator==(const BalanceEntry &) const = default;
  };

  struct AllowanceEntry : ssz::ssz_container {
    Address owner{};
    Address spender{};
    AmountWord amount{};

    SSZ_CONT(owner, spender, amount);
    bool operator==(const AllowanceEntry &) const = default;
  };

  /// Complete balance book of one asset
  struct BalanceSnapshot : ssz::ssz_container {
    AmountWord total_supply{};
    ssz::list<BalanceEntry, kMaxBookEntries> balances;
    ssz::list<AllowanceEntry, kMaxBookEntries> allowances;

    SSZ_CONT(total_supply, balances, allowances);
    bool operator==(const BalanceSnapshot &) const = default;
  };

}  // namespace bridge::token
