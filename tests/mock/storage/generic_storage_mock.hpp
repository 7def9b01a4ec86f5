/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "storage/buffer_storage.hpp"

namespace bridge::storage {

  class BufferBatchMock : public BufferBatch {
   public:
    MOCK_METHOD(outcome::result<void>,
                put,
                (const ByteView &key, ByteVecOrView &&value),
                (override));

    MOCK_METHOD(outcome::result<void>, remove, (const ByteView &key), (override));

    MOCK_METHOD(outcome::result<void>, commit, (), (override));
  };

  class BufferStorageMock : public BufferStorage {
   public:
    MOCK_METHOD(std::unique_ptr<BufferBatch>, batch, (), (override));

    MOCK_METHOD(outcome::result<ByteVec>, getMock, (const ByteView &), (const));

    outcome::result<ByteVecOrView> get(const ByteView &key) const override {
      OUTCOME_TRY(value, getMock(key));
      return std::move(value);
    }

    MOCK_METHOD(outcome::result<std::optional<ByteVec>>,
                tryGetMock,
                (const ByteView &),
                (const));

    outcome::result<std::optional<ByteVecOrView>> tryGet(
        const ByteView &key) const override {
      OUTCOME_TRY(value, tryGetMock(key));
      if (not value.has_value()) {
        return std::nullopt;
      }
      return std::make_optional(ByteVecOrView{std::move(value.value())});
    }

    MOCK_METHOD(outcome::result<bool>,
                contains,
                (const ByteView &key),
                (const, override));

    MOCK_METHOD(outcome::result<void>,
                put,
                (const ByteView &key, const ByteVec &value));

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override {
      return put(key, std::move(value).intoByteVec());
    }

    MOCK_METHOD(outcome::result<void>, remove, (const ByteView &key), (override));
  };

}  // namespace bridge::storage
