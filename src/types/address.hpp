/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_arr.hpp>

namespace bridge {
  /**
   * 32-byte identifier of an account, a contract or a token. Shorter native
   * addresses (e.g. 20-byte EVM ones) are left-padded with zeros.
   */
  using Address = qtils::ByteArr<32>;

  constexpr Address kZeroAddress{};

  inline bool isZero(const Address &address) {
    return address == kZeroAddress;
  }
}  // namespace bridge
