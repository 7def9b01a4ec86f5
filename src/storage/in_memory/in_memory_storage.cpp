/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include "storage/in_memory/in_memory_batch.hpp"
#include "storage/storage_error.hpp"

using qtils::ByteVec;

namespace bridge::storage {

  outcome::result<ByteVecOrView> InMemoryStorage::get(
      const ByteView &key) const {
    if (auto it = storage_.find(key.toHex()); it != storage_.end()) {
      return ByteView{it->second};
    }

    return StorageError::NOT_FOUND;
  }

  outcome::result<std::optional<ByteVecOrView>> InMemoryStorage::tryGet(
      const qtils::ByteView &key) const {
    if (auto it = storage_.find(key.toHex()); it != storage_.end()) {
      return ByteView{it->second};
    }

    return std::nullopt;
  }

  outcome::result<void> InMemoryStorage::put(const ByteView &key,
                                             ByteVecOrView &&value) {
    storage_[key.toHex()] = std::move(value).intoByteVec();
    return outcome::success();
  }

  outcome::result<bool> InMemoryStorage::contains(const ByteView &key) const {
    return storage_.find(key.toHex()) != storage_.end();
  }

  outcome::result<void> InMemoryStorage::remove(const ByteView &key) {
    storage_.erase(key.toHex());
    return outcome::success();
  }

  std::unique_ptr<BufferBatch> InMemoryStorage::batch() {
    return std::make_unique<InMemoryBatch>(*this);
  }
}  // namespace bridge::storage
