/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "token/fungible_token.hpp"

namespace bridge::token {

  /// Fungible token whose supply is controlled by exactly one minter
  class MintableToken : public FungibleToken {
   public:
    virtual const Address &minter() const = 0;

    virtual outcome::result<void> mint(const Address &caller,
                                       const Address &to,
                                       const Amount &amount) = 0;

    virtual outcome::result<void> burn(const Address &caller,
                                       const Address &from,
                                       const Amount &amount) = 0;
  };

}  // namespace bridge::token
