/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace rc::storage {

  /**
   * @brief Failures of LevelDB calls, after leveldb::Status codes. Missing
   * key is not among them, maps report it as none.
   */
  enum class LevelDBError {
    kCorruption = 1,
    kIOError,
    kInvalidArgument,
    kNotSupported,
    kUnknown,
  };

}  // namespace rc::storage

OUTCOME_HPP_DECLARE_ERROR(rc::storage, LevelDBError);
