/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "storage/buffer_map.hpp"

namespace rc::storage {
  /**
   * View of the keys of the underlying map starting with prefix.
   * Keys passed to the view are relative to the prefix, use `_key` to stage
   * writes of the view into a batch of the underlying map.
   */
  struct MapPrefix : BufferMap {
    MapPrefix(std::string_view prefix, MapPtr map);
    Bytes _key(BytesIn key) const;
    Bytes _key(std::string_view key) const;

    outcome::result<boost::optional<Bytes>> tryGet(
        const Bytes &key) const override;
    outcome::result<void> put(const Bytes &key, const Bytes &value) override;
    outcome::result<void> remove(const Bytes &key) override;

    Bytes prefix;
    MapPtr map;
  };

  /**
   * Single value stored under fixed key, e.g. a counter
   */
  struct OneKey {
    OneKey(std::string_view key, MapPtr map);
    outcome::result<boost::optional<Bytes>> tryGet() const;

    Bytes key;
    MapPtr map;
  };
}  // namespace rc::storage
