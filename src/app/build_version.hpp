/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace bridge {
  /// Version of the build, set by the build system
  const std::string &buildVersion();
}  // namespace bridge
