/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Fixed-width value encodings and typed reads over BufferStorage.
 */

#pragma once

#include <boost/endian/conversion.hpp>
#include <qtils/byte_vec.hpp>

#include "storage/buffer_storage.hpp"
#include "storage/keys.hpp"
#include "storage/storage_error.hpp"
#include "types/amount.hpp"

namespace bridge::storage {

  inline qtils::ByteVec encodeU64(uint64_t value) {
    qtils::ByteVec out(sizeof(value));
    boost::endian::store_big_u64(out.data(), value);
    return out;
  }

  inline outcome::result<uint64_t> decodeU64(qtils::ByteView bytes) {
    if (bytes.size() != sizeof(uint64_t)) {
      return StorageError::CORRUPTION;
    }
    return boost::endian::load_big_u64(bytes.data());
  }

  inline qtils::ByteVec encodeAmount(const Amount &value) {
    auto word = toWord(value);
    return qtils::ByteVec{word.begin(), word.end()};
  }

  inline outcome::result<Amount> decodeAmount(qtils::ByteView bytes) {
    AmountWord word{};
    if (bytes.size() != word.size()) {
      return StorageError::CORRUPTION;
    }
    std::copy(bytes.begin(), bytes.end(), word.begin());
    return fromWord(word);
  }

  /// @returns stored counter, zero when absent
  inline outcome::result<uint64_t> readU64(const BufferStorage &space,
                                           const qtils::ByteVec &key) {
    OUTCOME_TRY(value, space.tryGet(key));
    if (not value.has_value()) {
      return 0;
    }
    return decodeU64(value->view());
  }

  /// @returns stored amount, zero when absent
  inline outcome::result<Amount> readAmount(const BufferStorage &space,
                                            const qtils::ByteVec &key) {
    OUTCOME_TRY(value, space.tryGet(key));
    if (not value.has_value()) {
      return Amount{0};
    }
    return decodeAmount(value->view());
  }

  /**
   * Stamps an empty space with `expected` layout version, or checks the
   * stamp of a used one.
   */
  inline outcome::result<void> ensureSchemaVersion(BufferStorage &space,
                                                   uint64_t expected) {
    OUTCOME_TRY(stored, space.tryGet(kSchemaVersionKey));
    if (not stored.has_value()) {
      return space.put(kSchemaVersionKey, encodeU64(expected));
    }
    OUTCOME_TRY(version, decodeU64(stored->view()));
    if (version != expected) {
      return StorageError::SCHEMA_VERSION_MISMATCH;
    }
    return outcome::success();
  }

}  // namespace bridge::storage
