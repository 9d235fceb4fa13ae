/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/in_memory/in_memory_storage.hpp"

namespace rc::storage {

  /**
   * Stages writes in a map, removal is staged as none. Later write of the
   * same key replaces earlier one.
   */
  class InMemoryBatch : public BufferBatch {
   public:
    explicit InMemoryBatch(InMemoryStorage &db) : db_{db} {}

    outcome::result<void> put(const Bytes &key, const Bytes &value) override {
      staged_[key] = value;
      return outcome::success();
    }

    outcome::result<void> remove(const Bytes &key) override {
      staged_[key] = boost::none;
      return outcome::success();
    }

    outcome::result<void> commit() override {
      db_.apply(std::move(staged_));
      staged_.clear();
      return outcome::success();
    }

    void clear() override {
      staged_.clear();
    }

   private:
    InMemoryStorage &db_;
    InMemoryStorage::Entries staged_;
  };
}  // namespace rc::storage
