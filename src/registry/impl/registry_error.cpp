/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/registry_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(bridge::registry, RegistryError, e) {
  using E = bridge::registry::RegistryError;
  switch (e) {
    case E::INVALID_DOMAIN:
      return "Domain 0 is not a valid domain";
    case E::ZERO_ADDRESS:
      return "Zero address is not allowed";
    case E::CHAIN_ALREADY_EXISTS:
      return "Chain is already registered";
    case E::CHAIN_NOT_FOUND:
      return "Chain is not registered";
    case E::TOKEN_MAPPING_NOT_FOUND:
      return "Token mapping does not exist";
  }
  return "Unknown error";
}
