/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "storage/face/persistent_map.hpp"

namespace rc::storage {

  /** Bytes to bytes map, deal state and balances live in one of these */
  using BufferMap = face::Map<Bytes, Bytes>;

  using BufferBatch = face::WriteBatch<Bytes, Bytes>;

  using PersistentBufferMap = face::PersistentMap<Bytes, Bytes>;

  using MapPtr = std::shared_ptr<PersistentBufferMap>;

}  // namespace rc::storage
