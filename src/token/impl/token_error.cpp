/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "token/token_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(bridge::token, TokenError, e) {
  using E = bridge::token::TokenError;
  switch (e) {
    case E::INSUFFICIENT_BALANCE:
      return "Transfer amount exceeds balance";
    case E::INSUFFICIENT_ALLOWANCE:
      return "Transfer amount exceeds allowance";
    case E::UNAUTHORIZED:
      return "Caller is not the minter";
    case E::ZERO_ADDRESS:
      return "Zero address is not allowed";
    case E::SUPPLY_OVERFLOW:
      return "Total supply would overflow";
    case E::TOKEN_ALREADY_EXISTS:
      return "Synthetic token for this source token already exists";
    case E::INVALID_DECIMALS:
      return "Invalid token decimals";
    case E::TOKEN_NOT_FOUND:
      return "No synthetic token exists for this source token";
    case E::INVALID_METADATA:
      return "Token name or symbol is too long";
  }
  return "Unknown error";
}
