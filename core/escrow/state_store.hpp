/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/variant.hpp>

#include "escrow/deal.hpp"
#include "storage/map_prefix/prefix.hpp"

namespace rc::escrow {
  using storage::BufferBatch;
  using storage::MapPtr;

  /** Stored value, either integer or byte string */
  using Value = boost::variant<uint64_t, Bytes>;

  namespace keys {
    constexpr std::string_view kSeller{"seller"};
    constexpr std::string_view kBuyer{"buyer"};
    constexpr std::string_view kPrice{"price"};
    constexpr std::string_view kReserve{"reserve"};
    constexpr std::string_view kPropertyHash{"prop_hash"};
    constexpr std::string_view kCreated{"created"};
    constexpr std::string_view kDeadline{"deadline"};
    constexpr std::string_view kStatus{"status"};
  }  // namespace keys

  /**
   * Key/value state of one deal, stored under "deal/<id>/" of the shared map.
   * Values carry a type tag, so a stored zero or empty string is distinct from
   * an absent key.
   */
  class StateStore {
   public:
    enum class Tag : uint8_t { kBytes = 1, kUint = 2 };

    StateStore(MapPtr storage, DealId deal_id);

    /**
     * Read single value
     * @return EscrowError::kNotFound if the key was never written
     */
    outcome::result<Value> get(std::string_view key) const;

    outcome::result<void> put(std::string_view key, const Value &value);

    outcome::result<bool> exists(std::string_view key) const;

    /**
     * Decode typed snapshot of the whole deal
     * @return kNotFound if deal was never created, kStateCorrupted if any
     * field has unexpected type or encoding
     */
    outcome::result<Deal> load() const;

    /**
     * Write every field of deal into batch of the underlying map, nothing is
     * visible until the batch is committed
     */
    outcome::result<void> stage(BufferBatch &batch, const Deal &deal) const;

    DealId dealId() const;

    static Bytes encodeValue(const Value &value);
    static outcome::result<Value> decodeValue(BytesIn bytes);

   private:
    outcome::result<uint64_t> getUint(std::string_view key) const;
    outcome::result<Bytes> getBytes(std::string_view key) const;

    DealId deal_id_;
    storage::MapPrefix map_;
  };
}  // namespace rc::escrow
