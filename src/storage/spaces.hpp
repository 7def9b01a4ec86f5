/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Defines the Space enumeration used to identify logical storage spaces.
 *
 * Each bridge component persisting state owns one space, so a single write
 * batch of that component never spans spaces.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace bridge::storage {

  /**
   * @enum Space
   * @brief Enumerates the logical storage spaces used by the system.
   */
  enum class Space : uint8_t {
    Default = 0,    ///< Default space used for general-purpose storage
    HubLedger,      ///< processed messages, balances and counters of the hub
    SourceGateway,  ///< processed releases and deposit sequences of a gateway
    SyntheticAssets,  ///< synthetic asset directory and balance books
    // ... append here

    Total  ///< Total number of defined spaces (must be last)
  };

  constexpr size_t SpacesCount = static_cast<size_t>(Space::Total);
}  // namespace bridge::storage
