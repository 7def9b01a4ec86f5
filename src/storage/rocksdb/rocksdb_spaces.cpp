/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_spaces.hpp"

#include <algorithm>
#include <span>

#include <boost/assert.hpp>
#include <rocksdb/db.h>

namespace bridge::storage {

  // Names of non-default spaces, in Space order
  static constexpr std::string_view kNamesArr[] = {
      "hub_ledger",
      "source_gateway",
      "synthetic_assets",
  };
  constexpr std::span<const std::string_view> kNames = kNamesArr;

  static_assert(kNames.size() == (SpacesCount - 1));

  std::string_view spaceName(Space space) {
    if (space != Space::Default) {
      BOOST_ASSERT(space < Space::Total);
      return kNames[static_cast<size_t>(space) - 1];
    }
    return rocksdb::kDefaultColumnFamilyName;
  }

  std::optional<Space> spaceFromString(std::string_view string) {
    if (string == rocksdb::kDefaultColumnFamilyName) {
      return Space::Default;
    }
    const auto it = std::ranges::find(kNames, string);
    if (it == kNames.end()) {
      return std::nullopt;
    }
    return static_cast<Space>(std::distance(kNames.begin(), it) + 1);
  }

}  // namespace bridge::storage
