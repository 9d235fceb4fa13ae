/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "const.hpp"
#include "escrow/bundle_builder.hpp"
#include "escrow/deal_state_machine.hpp"

namespace rc::escrow::fixture {
  const Identity kSeller{"seller"};
  const Identity kBuyer{"buyer"};
  const Identity kStranger{"stranger"};

  constexpr TokenAmount kPrice{5000};
  const Bytes kHash{0xca, 0xfe, 0xba, 0xbe};
  constexpr UnixTime kNow{1700000000};

  /** Listing created by kSeller at kNow */
  inline Deal activeDeal(DealId deal_id = 1) {
    Deal deal;
    deal.id = deal_id;
    deal.seller = kSeller;
    deal.price = kPrice;
    deal.reserve = kPayoutReserve;
    deal.property_hash = kHash;
    deal.created_at = kNow;
    deal.deadline = kNow + kDealWindow;
    deal.status = DealStatus::kActive;
    return deal;
  }

  /** Listing with kBuyer offer recorded */
  inline Deal pendingDeal(DealId deal_id = 1) {
    auto deal{activeDeal(deal_id)};
    deal.buyer = kBuyer;
    deal.status = DealStatus::kPending;
    return deal;
  }
}  // namespace rc::escrow::fixture
