/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>

#include <qtils/outcome.hpp>

#include "types/address.hpp"

namespace bridge::access {

  /**
   * Single-owner access control. Administrative operations of a component
   * pass through `onlyOwner` before touching state.
   */
  class Ownable {
   public:
    explicit Ownable(const Address &owner);

    virtual ~Ownable() = default;

    Address owner() const;

    /**
     * Hands the administrative role over to `new_owner`
     * @returns UNAUTHORIZED unless `caller` is the current owner,
     * ZERO_ADDRESS for the zero `new_owner`
     */
    outcome::result<void> transferOwnership(const Address &caller,
                                            const Address &new_owner);

   protected:
    outcome::result<void> onlyOwner(const Address &caller) const;

   private:
    mutable std::mutex owner_mutex_;
    Address owner_{};
  };

}  // namespace bridge::access
