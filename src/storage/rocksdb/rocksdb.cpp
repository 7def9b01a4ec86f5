/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <qtils/error_throw.hpp>
#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <soralog/macro.hpp>
#include <sys/resource.h>

#include "app/configuration.hpp"
#include "storage/rocksdb/rocksdb_batch.hpp"
#include "storage/rocksdb/rocksdb_spaces.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"

namespace bridge::storage {
  namespace fs = std::filesystem;

  namespace {
    std::optional<size_t> openFilesSoftLimit(const log::Logger &logger) {
      rlimit r{};
      if (getrlimit(RLIMIT_NOFILE, &r) != 0) {
        SL_WARN(logger,
                "Error: getrlimit(RLIMIT_NOFILE) errno={} {}",
                errno,
                strerror(errno));
        return std::nullopt;
      }
      return r.rlim_cur;
    }

    rocksdb::ColumnFamilyOptions configureColumn(uint64_t memory_budget) {
      rocksdb::ColumnFamilyOptions options;
      options.OptimizeLevelStyleCompaction(memory_budget);
      options.table_factory.reset(
          NewBlockBasedTableFactory(RocksDb::tableOptionsConfiguration()));
      return options;
    }
  }  // namespace

  RocksDb::RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<app::Configuration> app_config)
      : logger_(logsys->getLogger("RocksDB", "storage")) {
    ro_.fill_cache = false;
    // ledger writes must survive a process crash
    wo_.sync = true;

    const auto &path = app_config->database().directory;

    auto options = rocksdb::Options{};
    options.create_if_missing = true;
    options.create_missing_column_families = true;
    options.table_factory.reset(rocksdb::NewBlockBasedTableFactory(
        storage::RocksDb::tableOptionsConfiguration()));

    // Setting limit for open rocksdb files to a half of system soft limit
    auto soft_limit = openFilesSoftLimit(logger_);
    if (not soft_limit) {
      SL_CRITICAL(logger_, "Call getrlimit(RLIMIT_NOFILE) was failed");
      qtils::raise(StorageError::UNKNOWN);
    }
    // NOLINTNEXTLINE(cppcoreguidelines-narrowing-conversions)
    options.max_open_files = soft_limit.value() / 2;

    std::error_code ec;
    create_directories(path, ec);
    if (ec) {
      SL_CRITICAL(logger_, "Can't create DB directory: {}", ec.message());
      qtils::raise(ec);
    }

    if (auto res = createDirectory(path, logger_); res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't create DB directory ({}): {}",
                  path.native(),
                  res.error());
      qtils::raise(res.error());
    }

    std::vector<std::string> existing_families;
    auto res = rocksdb::DB::ListColumnFamilies(
        options, path.native(), &existing_families);
    if (not res.ok() and not res.IsPathNotFound()
        and not res.IsIOError()) {
      SL_ERROR(logger_,
               "Can't list column families in {}: {}",
               path.native(),
               res.ToString());
      qtils::raise(status_as_error(res, logger_));
    }

    std::vector<std::string> all_families;
    for (size_t i = 0; i < SpacesCount; ++i) {
      all_families.emplace_back(spaceName(static_cast<Space>(i)));
    }
    for (auto &existing_family : existing_families) {
      if (std::ranges::find(all_families, existing_family)
          == all_families.end()) {
        SL_WARN(logger_,
                "Column family '{}' present in database but not used by "
                "bridge; Probably obsolete.",
                existing_family);
        all_families.emplace_back(existing_family);
      }
    }

    const auto memory_budget = app_config->database().cache_size;
    std::vector<rocksdb::ColumnFamilyDescriptor> column_family_descriptors;
    for (auto &family : all_families) {
      column_family_descriptors.emplace_back(
          family, configureColumn(memory_budget / all_families.size()));
      SL_DEBUG(logger_, "Column family '{}' configured", family);
    }

    const auto status = rocksdb::DB::Open(options,
                                          path.native(),
                                          column_family_descriptors,
                                          &column_family_handles_,
                                          &db_);
    if (not status.ok()) {
      SL_ERROR(logger_,
               "Can't open database in {}: {}",
               path.native(),
               status.ToString());
      qtils::raise(status_as_error(status, logger_));
    }
    SL_VERBOSE(logger_, "Database opened in {}", path.native());
  }

  RocksDb::~RocksDb() {
    if (db_ == nullptr) {
      return;
    }
    for (auto *handle : column_family_handles_) {
      auto status = db_->DestroyColumnFamilyHandle(handle);
      if (not status.ok()) {
        SL_ERROR(logger_,
                 "Can't destroy column family handle: {}",
                 status.ToString());
      }
    }
    auto status = db_->Close();
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't close database: {}", status.ToString());
    }
    delete db_;
  }

  outcome::result<void> RocksDb::createDirectory(
      const std::filesystem::path &absolute_path, log::Logger &log) {
    std::error_code ec;
    if (not fs::create_directory(absolute_path.native(), ec) and ec.value()) {
      SL_ERROR(log,
               "Can't create directory {} for database: {}",
               absolute_path.native(),
               ec.message());
      return StorageError::IO_ERROR;
    }
    if (not fs::is_directory(absolute_path.native())) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               absolute_path.native());
      return StorageError::IO_ERROR;
    }
    return outcome::success();
  }

  std::shared_ptr<BufferStorage> RocksDb::getSpace(Space space) {
    if (auto it = spaces_.find(space); it != spaces_.end()) {
      return it->second;
    }
    auto space_name = spaceName(space);
    auto column = std::ranges::find_if(
        column_family_handles_,
        [&space_name](const ColumnFamilyHandlePtr &handle) {
          return handle->GetName() == space_name;
        });
    if (column_family_handles_.end() == column) {
      qtils::raise(StorageError::INVALID_ARGUMENT);
    }
    auto space_ptr =
        std::make_shared<RocksDbSpace>(weak_from_this(), *column, logger_);
    spaces_[space] = space_ptr;
    return space_ptr;
  }

  rocksdb::BlockBasedTableOptions RocksDb::tableOptionsConfiguration(
      uint32_t lru_cache_size_mib, uint32_t block_size_kib) {
    rocksdb::BlockBasedTableOptions table_options;
    table_options.format_version = 5;
    table_options.block_cache = rocksdb::NewLRUCache(
        static_cast<uint64_t>(lru_cache_size_mib) * 1024 * 1024);
    table_options.block_size = static_cast<size_t>(block_size_kib) * 1024;
    table_options.cache_index_and_filter_blocks = true;
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));
    return table_options;
  }

  RocksDbSpace::RocksDbSpace(std::weak_ptr<RocksDb> storage,
                             const RocksDb::ColumnFamilyHandlePtr &column,
                             log::Logger logger)
      : storage_{std::move(storage)},
        column_{column},
        logger_{std::move(logger)} {}

  std::unique_ptr<BufferBatch> RocksDbSpace::batch() {
    return std::make_unique<RocksDbBatch>(*this, logger_);
  }

  outcome::result<bool> RocksDbSpace::contains(const ByteView &key) const {
    OUTCOME_TRY(rocks, use());
    std::string value;
    auto status = rocks->db_->Get(rocks->ro_, column_, make_slice(key), &value);
    if (status.ok()) {
      return true;
    }

    if (status.IsNotFound()) {
      return false;
    }

    return status_as_error(status, logger_);
  }

  outcome::result<ByteVecOrView> RocksDbSpace::get(const ByteView &key) const {
    OUTCOME_TRY(rocks, use());
    std::string value;
    auto status = rocks->db_->Get(rocks->ro_, column_, make_slice(key), &value);
    if (status.ok()) {
      return make_buffer(value);
    }
    return status_as_error(status, logger_);
  }

  outcome::result<std::optional<ByteVecOrView>> RocksDbSpace::tryGet(
      const ByteView &key) const {
    OUTCOME_TRY(rocks, use());
    std::string value;
    auto status = rocks->db_->Get(rocks->ro_, column_, make_slice(key), &value);
    if (status.ok()) {
      return std::make_optional(ByteVecOrView(make_buffer(value)));
    }

    if (status.IsNotFound()) {
      return std::nullopt;
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::put(const ByteView &key,
                                          ByteVecOrView &&value) {
    OUTCOME_TRY(rocks, use());
    auto status = rocks->db_->Put(
        rocks->wo_, column_, make_slice(key), make_slice(std::move(value)));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::remove(const ByteView &key) {
    OUTCOME_TRY(rocks, use());
    auto status = rocks->db_->Delete(rocks->wo_, column_, make_slice(key));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<std::shared_ptr<RocksDb>> RocksDbSpace::use() const {
    auto rocks = storage_.lock();
    if (not rocks) {
      return StorageError::STORAGE_GONE;
    }
    return rocks;
  }

}  // namespace bridge::storage
