/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/map_prefix/prefix.hpp"

namespace rc::storage {
  using common::span::cbytes;

  MapPrefix::MapPrefix(std::string_view prefix, MapPtr map)
      : prefix{copy(cbytes(prefix))}, map{std::move(map)} {}

  Bytes MapPrefix::_key(BytesIn key) const {
    auto full{prefix};
    append(full, key);
    return full;
  }

  Bytes MapPrefix::_key(std::string_view key) const {
    return _key(cbytes(key));
  }

  outcome::result<boost::optional<Bytes>> MapPrefix::tryGet(
      const Bytes &key) const {
    return map->tryGet(_key(BytesIn{key}));
  }

  outcome::result<void> MapPrefix::put(const Bytes &key, const Bytes &value) {
    return map->put(_key(BytesIn{key}), value);
  }

  outcome::result<void> MapPrefix::remove(const Bytes &key) {
    return map->remove(_key(BytesIn{key}));
  }

  OneKey::OneKey(std::string_view key, MapPtr map)
      : key{copy(cbytes(key))}, map{std::move(map)} {}

  outcome::result<boost::optional<Bytes>> OneKey::tryGet() const {
    return map->tryGet(key);
  }
}  // namespace rc::storage
