/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Key layout of the bridge storage spaces.
 *
 * Every record kind gets a one-byte prefix followed by fixed-size fields,
 * so records of different kinds never collide inside one space.
 */

#pragma once

#include <boost/endian/conversion.hpp>
#include <qtils/byte_vec.hpp>
#include <qtils/literals.hpp>

#include "types/address.hpp"
#include "types/message.hpp"

namespace bridge::storage {

  using qtils::literals::operator""_vec;

  /// Layout version of the component spaces
  inline const qtils::ByteVec kSchemaVersionKey = ":bridge:schema_version"_vec;

  enum class KeyPrefix : uint8_t {
    ProcessedMessage = 'p',
    Balance = 'b',
    ProcessedCount = 'c',
    Nonce = 'n',
    SyntheticCount = 'k',
    SyntheticRecord = 'r',
    AssetBook = 's',
  };

  namespace detail {
    inline void append(qtils::ByteVec &key, const Address &address) {
      key.insert(key.end(), address.begin(), address.end());
    }
  }  // namespace detail

  inline qtils::ByteVec processedMessageKey(const MessageId &id) {
    qtils::ByteVec key{static_cast<uint8_t>(KeyPrefix::ProcessedMessage)};
    key.insert(key.end(), id.begin(), id.end());
    return key;
  }

  inline qtils::ByteVec balanceKey(const Address &user, const Address &asset) {
    qtils::ByteVec key{static_cast<uint8_t>(KeyPrefix::Balance)};
    detail::append(key, user);
    detail::append(key, asset);
    return key;
  }

  inline qtils::ByteVec processedCountKey(const Address &user) {
    qtils::ByteVec key{static_cast<uint8_t>(KeyPrefix::ProcessedCount)};
    detail::append(key, user);
    return key;
  }

  inline qtils::ByteVec nonceKey(const Address &user) {
    qtils::ByteVec key{static_cast<uint8_t>(KeyPrefix::Nonce)};
    detail::append(key, user);
    return key;
  }

  inline qtils::ByteVec syntheticCountKey() {
    return qtils::ByteVec{static_cast<uint8_t>(KeyPrefix::SyntheticCount)};
  }

  inline qtils::ByteVec syntheticRecordKey(uint64_t index) {
    qtils::ByteVec key(1 + sizeof(index));
    key[0] = static_cast<uint8_t>(KeyPrefix::SyntheticRecord);
    boost::endian::store_big_u64(key.data() + 1, index);
    return key;
  }

  inline qtils::ByteVec assetBookKey(const Address &asset) {
    qtils::ByteVec key{static_cast<uint8_t>(KeyPrefix::AssetBook)};
    detail::append(key, asset);
    return key;
  }

}  // namespace bridge::storage
