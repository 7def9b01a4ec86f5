/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>

#include <qtils/byte_vec.hpp>

#include "storage/in_memory/in_memory_storage.hpp"

namespace bridge::storage {
  using qtils::ByteVec;

  /**
   * Accumulates puts and removals; the last operation on a key wins.
   * Nothing reaches the storage before commit().
   */
  class InMemoryBatch : public BufferBatch {
   public:
    explicit InMemoryBatch(InMemoryStorage &db) : db{db} {}

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override {
      entries[key.toHex()] = std::move(value).intoByteVec();
      return outcome::success();
    }

    outcome::result<void> remove(const ByteView &key) override {
      entries[key.toHex()] = std::nullopt;
      return outcome::success();
    }

    outcome::result<void> commit() override {
      for (auto &[hex, value] : entries) {
        auto key = ByteVec::fromHex(hex).value();
        if (value.has_value()) {
          OUTCOME_TRY(db.put(key, ByteView{*value}));
        } else {
          OUTCOME_TRY(db.remove(key));
        }
      }
      return outcome::success();
    }

   private:
    std::map<std::string, std::optional<ByteVec>> entries;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    InMemoryStorage &db;
  };
}  // namespace bridge::storage
