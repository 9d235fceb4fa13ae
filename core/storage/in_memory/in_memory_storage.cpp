/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include "storage/in_memory/in_memory_batch.hpp"

namespace rc::storage {

  outcome::result<boost::optional<Bytes>> InMemoryStorage::tryGet(
      const Bytes &key) const {
    std::shared_lock lock{mutex_};
    auto it{entries_.find(key)};
    if (it == entries_.end()) {
      return boost::none;
    }
    return it->second;
  }

  outcome::result<void> InMemoryStorage::put(const Bytes &key,
                                             const Bytes &value) {
    std::unique_lock lock{mutex_};
    entries_[key] = value;
    return outcome::success();
  }

  outcome::result<void> InMemoryStorage::remove(const Bytes &key) {
    std::unique_lock lock{mutex_};
    entries_.erase(key);
    return outcome::success();
  }

  std::unique_ptr<BufferBatch> InMemoryStorage::batch() {
    return std::make_unique<InMemoryBatch>(*this);
  }

  size_t InMemoryStorage::size() const {
    std::shared_lock lock{mutex_};
    return entries_.size();
  }

  void InMemoryStorage::apply(Entries &&entries) {
    std::unique_lock lock{mutex_};
    for (auto &[key, value] : entries) {
      if (value) {
        entries_[key] = std::move(*value);
      } else {
        entries_.erase(key);
      }
    }
  }
}  // namespace rc::storage
