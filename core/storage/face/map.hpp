/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "common/outcome.hpp"
#include "storage/storage_error.hpp"

namespace rc::storage::face {

  /**
   * @brief Key-value map. Absence of key is not an error of storage, so
   * implementations provide `tryGet`, which fails only when storage fails.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct Map {
    virtual ~Map() = default;

    /**
     * @brief Lookup value by key
     * @return value, none if key is absent, or error of storage
     */
    virtual outcome::result<boost::optional<V>> tryGet(const K &key) const = 0;

    virtual outcome::result<void> put(const K &key, const V &value) = 0;

    /** Removing absent key succeeds */
    virtual outcome::result<void> remove(const K &key) = 0;

    /**
     * @brief Get value which must be present
     * @return value or StorageError::kNotFound
     */
    outcome::result<V> get(const K &key) const {
      OUTCOME_TRY(value, tryGet(key));
      if (!value) {
        return StorageError::kNotFound;
      }
      return std::move(*value);
    }

    outcome::result<bool> contains(const K &key) const {
      OUTCOME_TRY(value, tryGet(key));
      return value.has_value();
    }
  };

}  // namespace rc::storage::face
