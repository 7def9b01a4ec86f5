/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "access/ownable.hpp"

#include <qtils/error_throw.hpp>

#include "access/access_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(bridge::access, AccessError, e) {
  using E = bridge::access::AccessError;
  switch (e) {
    case E::UNAUTHORIZED:
      return "Caller is not the owner";
    case E::ZERO_ADDRESS:
      return "Owner can not be the zero address";
  }
  return "Unknown error";
}

namespace bridge::access {

  Ownable::Ownable(const Address &owner) : owner_(owner) {
    if (isZero(owner)) {
      qtils::raise(AccessError::ZERO_ADDRESS);
    }
  }

  Address Ownable::owner() const {
    std::lock_guard lock{owner_mutex_};
    return owner_;
  }

  outcome::result<void> Ownable::transferOwnership(const Address &caller,
                                                   const Address &new_owner) {
    std::lock_guard lock{owner_mutex_};
    if (caller != owner_) {
      return AccessError::UNAUTHORIZED;
    }
    if (isZero(new_owner)) {
      return AccessError::ZERO_ADDRESS;
    }
    owner_ = new_owner;
    return outcome::success();
  }

  outcome::result<void> Ownable::onlyOwner(const Address &caller) const {
    std::lock_guard lock{owner_mutex_};
    if (caller != owner_) {
      return AccessError::UNAUTHORIZED;
    }
    return outcome::success();
  }

}  // namespace bridge::access
