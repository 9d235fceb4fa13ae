/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rc::storage, StorageError, e) {
  using rc::storage::StorageError;
  switch (e) {
    case StorageError::kNotFound:
      return "StorageError: key not found";
  }
  return "StorageError: unknown error";
}
