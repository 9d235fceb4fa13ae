/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <shared_mutex>

#include "storage/buffer_map.hpp"

namespace rc::storage {
  /**
   * Map kept in process memory, same contract as LevelDB without a disk.
   * Escrow tests and dry runs use it.
   */
  class InMemoryStorage : public PersistentBufferMap {
   public:
    /** Puts and removals (empty value) of a batch */
    using Entries = std::map<Bytes, boost::optional<Bytes>>;

    outcome::result<boost::optional<Bytes>> tryGet(
        const Bytes &key) const override;

    outcome::result<void> put(const Bytes &key, const Bytes &value) override;

    outcome::result<void> remove(const Bytes &key) override;

    std::unique_ptr<BufferBatch> batch() override;

    size_t size() const;

    /** Applies all entries under one lock, readers see all or none */
    void apply(Entries &&entries);

   private:
    mutable std::shared_mutex mutex_;
    std::map<Bytes, Bytes> entries_;
  };

}  // namespace rc::storage
