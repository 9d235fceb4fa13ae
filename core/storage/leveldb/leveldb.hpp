/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <leveldb/db.h>
#include <string_view>

#include "common/logger.hpp"
#include "storage/buffer_map.hpp"

namespace rc::storage {

  /**
   * @brief Persistent map on LevelDB. Escrow opens one per repository
   * directory, writes are synced to disk before they are reported done.
   */
  class LevelDB : public PersistentBufferMap {
   public:
    /**
     * @brief Opens database, creates it if directory has none
     * @param path database directory
     * @return instance of LevelDB or error of LevelDB
     */
    static outcome::result<std::shared_ptr<LevelDB>> create(
        std::string_view path);

    /**
     * @brief Opens database with explicit options
     * @param path database directory
     * @param options leveldb options, such as create_if_missing
     * @param sync whether writes wait for disk
     */
    static outcome::result<std::shared_ptr<LevelDB>> create(
        std::string_view path, const leveldb::Options &options, bool sync);

    std::unique_ptr<BufferBatch> batch() override;

    outcome::result<boost::optional<Bytes>> tryGet(
        const Bytes &key) const override;

    outcome::result<void> put(const Bytes &key, const Bytes &value) override;

    outcome::result<void> remove(const Bytes &key) override;

   private:
    class Batch;

    outcome::result<void> check(const leveldb::Status &status) const;

    std::unique_ptr<leveldb::DB> db_;
    leveldb::WriteOptions write_options_;
    common::Logger logger_ = common::createLogger("leveldb");
  };

}  // namespace rc::storage
