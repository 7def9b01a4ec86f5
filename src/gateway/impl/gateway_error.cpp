/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/gateway_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(bridge::gateway, GatewayError, e) {
  using E = bridge::gateway::GatewayError;
  switch (e) {
    case E::NOT_CONFIGURED:
      return "Cross-chain config is not set";
    case E::INVALID_CONFIG:
      return "Cross-chain config is invalid";
    case E::ZERO_AMOUNT:
      return "Amount must be positive";
    case E::ZERO_ADDRESS:
      return "Zero address is not allowed";
    case E::NOT_WHITELISTED:
      return "Token is not whitelisted";
    case E::INSUFFICIENT_FUNDS:
      return "Depositor balance or allowance is insufficient";
    case E::UNAUTHORIZED:
      return "Caller is not the configured transport";
    case E::UNTRUSTED_ORIGIN:
      return "Message does not come from the hub";
    case E::MALFORMED_MESSAGE:
      return "Message body is malformed";
    case E::UNEXPECTED_MESSAGE_KIND:
      return "Message kind is not expected here";
    case E::TOKEN_MAPPING_NOT_FOUND:
      return "No local token is mapped to the synthetic asset";
    case E::INSUFFICIENT_CUSTODY:
      return "Gateway custody is insufficient for the release";
  }
  return "Unknown error";
}
