/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/deal.hpp"

#include "const.hpp"

namespace rc::escrow {
  std::string_view dealStatusName(DealStatus status) {
    switch (status) {
      case DealStatus::kActive:
        return "active";
      case DealStatus::kPending:
        return "pending";
      case DealStatus::kCompleted:
        return "completed";
      case DealStatus::kCancelled:
        return "cancelled";
    }
    return "unknown";
  }

  Identity custodianOf(DealId deal_id) {
    return std::string{kCustodianPrefix} + std::to_string(deal_id);
  }
}  // namespace rc::escrow
