/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hub/hub_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(bridge::hub, HubError, e) {
  using E = bridge::hub::HubError;
  switch (e) {
    case E::NOT_CONFIGURED:
      return "Cross-chain config is not set";
    case E::INVALID_CONFIG:
      return "Cross-chain config is invalid";
    case E::UNAUTHORIZED:
      return "Caller is not authorized";
    case E::UNTRUSTED_ORIGIN:
      return "Message does not come from a trusted gateway";
    case E::MALFORMED_MESSAGE:
      return "Message body is malformed";
    case E::UNEXPECTED_MESSAGE_KIND:
      return "Message kind is not expected here";
    case E::TOKEN_REGISTRY_NOT_SET:
      return "Token registry is not set";
    case E::UNMAPPED_TOKEN:
      return "Deposited token has no synthetic mapping";
    case E::UNKNOWN_ASSET:
      return "Synthetic asset is unknown";
    case E::ZERO_AMOUNT:
      return "Amount must be positive";
    case E::ZERO_ADDRESS:
      return "Zero address is not allowed";
    case E::UNKNOWN_CHAIN:
      return "Destination chain has no active endpoint";
    case E::WRONG_DESTINATION_CHAIN:
      return "Synthetic asset can be withdrawn only to its source chain";
    case E::INSUFFICIENT_BALANCE:
      return "Ledger balance is insufficient";
    case E::BALANCE_OVERFLOW:
      return "Ledger balance would overflow";
  }
  return "Unknown error";
}
