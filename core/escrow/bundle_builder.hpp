/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "escrow/bundle.hpp"

namespace rc::escrow {
  /**
   * Client side helpers, build the bundle which escrow expects for action on
   * deal. Result still has to be signed by the caller.
   */

  AppCall makeCall(const Deal &deal,
                   const Identity &caller,
                   std::string_view method,
                   std::vector<Bytes> args = {});

  /** Deposit of full price to custodian followed by make_offer */
  Bundle offerBundle(const Deal &deal, const Identity &buyer);

  /**
   * Payout to seller followed by confirm_transfer
   * @param property_hash - attached to call when not empty
   */
  outcome::result<Bundle> payoutBundle(const Deal &deal,
                                       const Identity &seller,
                                       const Bytes &property_hash = {});

  /** Refund to buyer, if any, followed by cancel_deal */
  outcome::result<Bundle> cancelBundle(const Deal &deal,
                                       const Identity &caller);
}  // namespace rc::escrow
