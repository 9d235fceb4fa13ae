/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/leveldb/leveldb.hpp"

#include <leveldb/write_batch.h>

#include "storage/leveldb/leveldb_error.hpp"

namespace rc::storage {
  namespace {
    leveldb::Slice slice(BytesIn bytes) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
    }

    LevelDBError errorOf(const leveldb::Status &status) {
      if (status.IsCorruption()) {
        return LevelDBError::kCorruption;
      }
      if (status.IsIOError()) {
        return LevelDBError::kIOError;
      }
      if (status.IsInvalidArgument()) {
        return LevelDBError::kInvalidArgument;
      }
      if (status.IsNotSupportedError()) {
        return LevelDBError::kNotSupported;
      }
      return LevelDBError::kUnknown;
    }
  }  // namespace

  class LevelDB::Batch : public BufferBatch {
   public:
    explicit Batch(LevelDB &db) : db_{db} {}

    outcome::result<void> put(const Bytes &key, const Bytes &value) override {
      batch_.Put(slice(key), slice(value));
      return outcome::success();
    }

    outcome::result<void> remove(const Bytes &key) override {
      batch_.Delete(slice(key));
      return outcome::success();
    }

    outcome::result<void> commit() override {
      OUTCOME_TRY(db_.check(db_.db_->Write(db_.write_options_, &batch_)));
      batch_.Clear();
      return outcome::success();
    }

    void clear() override {
      batch_.Clear();
    }

   private:
    LevelDB &db_;
    leveldb::WriteBatch batch_;
  };

  outcome::result<std::shared_ptr<LevelDB>> LevelDB::create(
      std::string_view path) {
    leveldb::Options options;
    options.create_if_missing = true;
    return create(path, options, true);
  }

  outcome::result<std::shared_ptr<LevelDB>> LevelDB::create(
      std::string_view path, const leveldb::Options &options, bool sync) {
    leveldb::DB *raw{nullptr};
    const auto status{leveldb::DB::Open(options, std::string{path}, &raw)};
    std::unique_ptr<leveldb::DB> db{raw};
    auto instance{std::make_shared<LevelDB>()};
    OUTCOME_TRY(instance->check(status));
    instance->db_ = std::move(db);
    instance->write_options_.sync = sync;
    return std::move(instance);
  }

  outcome::result<void> LevelDB::check(const leveldb::Status &status) const {
    if (status.ok()) {
      return outcome::success();
    }
    logger_->error("{}", status.ToString());
    return errorOf(status);
  }

  std::unique_ptr<BufferBatch> LevelDB::batch() {
    return std::make_unique<Batch>(*this);
  }

  outcome::result<boost::optional<Bytes>> LevelDB::tryGet(
      const Bytes &key) const {
    std::string value;
    const auto status{db_->Get(leveldb::ReadOptions{}, slice(key), &value)};
    if (status.IsNotFound()) {
      return boost::none;
    }
    OUTCOME_TRY(check(status));
    return copy(common::span::cbytes(value));
  }

  outcome::result<void> LevelDB::put(const Bytes &key, const Bytes &value) {
    return check(db_->Put(write_options_, slice(key), slice(value)));
  }

  outcome::result<void> LevelDB::remove(const Bytes &key) {
    return check(db_->Delete(write_options_, slice(key)));
  }

}  // namespace rc::storage
