/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/ssz++.hpp>

#include "types/address.hpp"
#include "types/amount.hpp"
#include "types/domain.hpp"

namespace bridge {

  /// Deduplication key of a cross-chain message
  using MessageId = qtils::ByteArr<32>;

  enum class MessageKind : uint8_t {
    DEPOSIT = 1,  ///< source gateway -> hub, credit synthetic
    RELEASE = 2,  ///< hub -> source gateway, unlock collateral
  };

  /**
   * Decoded cross-chain message. `sender` comes from the transport envelope;
   * the rest is carried in the body. The body's `origin_domain` must match
   * the domain attested by the transport.
   */
  struct Message {
    MessageKind kind = MessageKind::DEPOSIT;
    Domain origin_domain = kInvalidDomain;
    Address sender{};
    Address token{};
    Address recipient{};
    Amount amount;
    uint64_t sequence = 0;

    bool operator==(const Message &) const = default;
  };

  /// Wire layout of the message body
  struct MessageBody : ssz::ssz_container {
    uint8_t kind = 0;
    Address token{};
    Address recipient{};
    AmountWord amount{};
    uint32_t origin_domain = 0;
    uint64_t sequence = 0;

    SSZ_CONT(kind, token, recipient, amount, origin_domain, sequence);
  };

  constexpr size_t kEncodedBodySize = sizeof(uint8_t) + 3 * 32
                                    + sizeof(uint32_t) + sizeof(uint64_t);

}  // namespace bridge
