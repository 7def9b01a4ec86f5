/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_batch.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"

namespace bridge::storage {

  RocksDbBatch::RocksDbBatch(RocksDbSpace &db, log::Logger logger)
      : db_(db), logger_(std::move(logger)) {}

  outcome::result<void> RocksDbBatch::put(const ByteView &key,
                                          ByteVecOrView &&value) {
    auto status = batch_.Put(
        db_.column_, make_slice(key), make_slice(std::move(value)));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbBatch::remove(const ByteView &key) {
    auto status = batch_.Delete(db_.column_, make_slice(key));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbBatch::commit() {
    OUTCOME_TRY(rocks, db_.use());
    auto status = rocks->db_->Write(rocks->wo_, &batch_);
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }
}  // namespace bridge::storage
