/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/leveldb/leveldb_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rc::storage, LevelDBError, e) {
  using E = rc::storage::LevelDBError;
  switch (e) {
    case E::kCorruption:
      return "LevelDBError: database files are corrupted";
    case E::kIOError:
      return "LevelDBError: filesystem operation failed";
    case E::kInvalidArgument:
      return "LevelDBError: invalid argument, e.g. database missing";
    case E::kNotSupported:
      return "LevelDBError: operation not supported";
    case E::kUnknown:
      break;
  }
  return "LevelDBError: unknown error";
}
