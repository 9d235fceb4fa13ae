/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/storage/base_leveldb_test.hpp"

namespace test {

  BaseLevelDB_Test::BaseLevelDB_Test(const fs::path &path)
      : BaseFS_Test(path) {}

  void BaseLevelDB_Test::open() {
    auto db{LevelDB::create(getPathString())};
    ASSERT_TRUE(db) << db.error().message();
    db_ = std::move(db.value());
  }

  void BaseLevelDB_Test::reopen() {
    // lock file is released only when database is destroyed
    db_.reset();
    open();
  }

  void BaseLevelDB_Test::SetUp() {
    BaseFS_Test::SetUp();
    open();
  }

  void BaseLevelDB_Test::TearDown() {
    db_.reset();
    BaseFS_Test::TearDown();
  }
}  // namespace test
