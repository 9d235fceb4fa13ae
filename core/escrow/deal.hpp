/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <string_view>

#include "clock/time.hpp"
#include "common/bytes.hpp"
#include "primitives/types.hpp"

namespace rc::escrow {
  using clock::UnixTime;
  using primitives::DealId;
  using primitives::Identity;
  using primitives::TokenAmount;

  /**
   * Values are persisted, do not renumber
   */
  enum class DealStatus : uint64_t {
    kActive = 0,
    kPending = 1,
    kCompleted = 2,
    kCancelled = 3,
  };

  std::string_view dealStatusName(DealStatus status);

  /**
   * Typed snapshot of one escrow instance
   */
  struct Deal {
    DealId id{};
    Identity seller;
    /** Set exactly once, on Active -> Pending */
    boost::optional<Identity> buyer;
    /** Immutable after creation */
    TokenAmount price{};
    /** Payout reserve in force at creation, kept for the deal's lifetime */
    TokenAmount reserve{};
    /** Fingerprint of off-chain property documents */
    Bytes property_hash;
    UnixTime created_at{};
    /** created_at + deal window, never extended */
    UnixTime deadline{};
    DealStatus status{DealStatus::kActive};

    bool isTerminal() const {
      return status == DealStatus::kCompleted
             || status == DealStatus::kCancelled;
    }

    bool operator==(const Deal &other) const {
      return id == other.id && seller == other.seller && buyer == other.buyer
             && price == other.price && reserve == other.reserve
             && property_hash == other.property_hash
             && created_at == other.created_at && deadline == other.deadline
             && status == other.status;
    }
    bool operator!=(const Deal &other) const {
      return !(*this == other);
    }
  };

  /** Account holding the buyer's funds between offer and settlement */
  Identity custodianOf(DealId deal_id);
}  // namespace rc::escrow
