/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef BRIDGE_BUILD_VERSION
#define BRIDGE_BUILD_VERSION "unknown"
#endif

namespace bridge {
  const std::string &buildVersion() {
    static const std::string version{BRIDGE_BUILD_VERSION};
    return version;
  }
}  // namespace bridge
