/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <iterator>
#include <limits>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>
#include <qtils/byte_arr.hpp>

namespace bridge {
  /// Token quantity in the native precision of the token it refers to
  using Amount = boost::multiprecision::uint256_t;

  /// Big-endian 256-bit word, the wire form of an Amount
  using AmountWord = qtils::ByteArr<32>;

  inline const Amount kMaxAmount = std::numeric_limits<Amount>::max();

  inline AmountWord toWord(const Amount &value) {
    std::vector<uint8_t> bytes;
    bytes.reserve(32);
    boost::multiprecision::export_bits(value, std::back_inserter(bytes), 8);
    AmountWord word{};
    std::copy(bytes.begin(),
              bytes.end(),
              std::next(word.begin(),
                        static_cast<std::ptrdiff_t>(word.size() - bytes.size())));
    return word;
  }

  inline Amount fromWord(const AmountWord &word) {
    Amount value;
    boost::multiprecision::import_bits(value, word.begin(), word.end(), 8);
    return value;
  }

  /// @returns true when `a + b` does not fit into 256 bits
  inline bool addOverflows(const Amount &a, const Amount &b) {
    return b > kMaxAmount - a;
  }
}  // namespace bridge

template <>
struct fmt::formatter<bridge::Amount> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const bridge::Amount &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(v.str(), ctx);
  }
};
