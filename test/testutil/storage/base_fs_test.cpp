/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/storage/base_fs_test.hpp"

namespace test {

  BaseFS_Test::BaseFS_Test(const fs::path &name)
      : base_path{fs::temp_directory_path() / name} {}

  BaseFS_Test::~BaseFS_Test() {
    clear();
  }

  void BaseFS_Test::clear() {
    boost::system::error_code ec;
    fs::remove_all(base_path, ec);
    if (ec) {
      logger->warn("cannot remove {}: {}", base_path.string(), ec.message());
    }
  }

  std::string BaseFS_Test::getPathString() const {
    return base_path.string();
  }

  void BaseFS_Test::SetUp() {
    clear();
    fs::create_directories(base_path);
    logger->debug("test directory {}", base_path.string());
  }

  void BaseFS_Test::TearDown() {
    clear();
  }
}  // namespace test
