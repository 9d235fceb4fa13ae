/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "storage/face/map.hpp"

namespace rc::storage::face {

  /**
   * @brief Writes staged together. Nothing is visible in the map until
   * commit, then everything is.
   */
  template <typename K, typename V>
  struct WriteBatch {
    virtual ~WriteBatch() = default;

    virtual outcome::result<void> put(const K &key, const V &value) = 0;

    virtual outcome::result<void> remove(const K &key) = 0;

    /**
     * @brief Applies staged writes atomically, batch is empty after success
     */
    virtual outcome::result<void> commit() = 0;

    /** Drops staged writes */
    virtual void clear() = 0;
  };

  /**
   * @brief Map which survives restart and supports atomic multi-key writes
   */
  template <typename K, typename V>
  struct PersistentMap : public Map<K, V> {
    virtual std::unique_ptr<WriteBatch<K, V>> batch() = 0;
  };

}  // namespace rc::storage::face
