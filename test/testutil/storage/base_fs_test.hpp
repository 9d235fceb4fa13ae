/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

#include "common/logger.hpp"

namespace fs = boost::filesystem;

namespace test {

  /**
   * @brief Test owning a directory under system temp, the directory is empty
   * when test starts and removed when it ends
   */
  struct BaseFS_Test : public ::testing::Test {
    explicit BaseFS_Test(const fs::path &name);

    ~BaseFS_Test() override;

    /** Removes directory with its contents */
    void clear();

    std::string getPathString() const;

    void SetUp() override;

    void TearDown() override;

   protected:
    fs::path base_path;
    rc::common::Logger logger{rc::common::createLogger("test")};
  };

}  // namespace test
