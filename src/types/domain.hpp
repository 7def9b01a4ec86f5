/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace bridge {
  /// Network identifier, agreed out-of-band between all participants
  using Domain = uint32_t;

  constexpr Domain kInvalidDomain = 0;
}  // namespace bridge
