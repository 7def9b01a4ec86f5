/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Byte-keyed storage of one space and its write batches.
 */

#pragma once

#include <memory>
#include <optional>

#include <qtils/byte_vec.hpp>
#include <qtils/byte_vec_or_view.hpp>
#include <qtils/outcome.hpp>

namespace bridge::storage {

  using qtils::ByteVec;
  using qtils::ByteVecOrView;
  using qtils::ByteView;

  /**
   * Group of writes applied together by commit(): either all of them reach
   * the storage or none does.
   */
  class BufferBatch {
   public:
    virtual ~BufferBatch() = default;

    virtual outcome::result<void> put(const ByteView &key,
                                      ByteVecOrView &&value) = 0;

    virtual outcome::result<void> remove(const ByteView &key) = 0;

    virtual outcome::result<void> commit() = 0;
  };

  class BufferStorage {
   public:
    virtual ~BufferStorage() = default;

    [[nodiscard]] virtual outcome::result<bool> contains(
        const ByteView &key) const = 0;

    /// @returns StorageError::NOT_FOUND for an absent key
    [[nodiscard]] virtual outcome::result<ByteVecOrView> get(
        const ByteView &key) const = 0;

    /// @returns std::nullopt for an absent key
    [[nodiscard]] virtual outcome::result<std::optional<ByteVecOrView>> tryGet(
        const ByteView &key) const = 0;

    virtual outcome::result<void> put(const ByteView &key,
                                      ByteVecOrView &&value) = 0;

    virtual outcome::result<void> remove(const ByteView &key) = 0;

    virtual std::unique_ptr<BufferBatch> batch() = 0;
  };

}  // namespace bridge::storage
