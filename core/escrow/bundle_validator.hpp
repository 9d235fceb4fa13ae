/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "escrow/bundle.hpp"
#include "ledger/ledger.hpp"

namespace rc::escrow {
  using ledger::Transfer;

  /**
   * Amount released from custodian on settlement or refund
   * Reserve is the one stored with the deal at creation
   * @return kInvalidPrice if reserve does not leave anything to pay
   */
  outcome::result<TokenAmount> payoutAmount(const Deal &deal);

  /**
   * Checks that bundle ends with the single call of method for this deal,
   * sent by caller
   * @return the call, or kBundleMismatch
   */
  outcome::result<const AppCall *> validateCall(const Deal &deal,
                                                const Identity &caller,
                                                std::string_view method,
                                                const Bundle &bundle);

  /**
   * make_offer: pay(caller -> custodian, price) + call
   * @return deposit to apply
   */
  outcome::result<Transfer> validateOfferBundle(const Deal &deal,
                                                const Identity &caller,
                                                const Bundle &bundle);

  /**
   * confirm_transfer: pay(custodian -> seller, price - reserve) + call. The
   * call may carry property hash as first argument, it must match the deal.
   * @return payout to apply, kPropertyHashMismatch on other hash
   */
  outcome::result<Transfer> validatePayoutBundle(const Deal &deal,
                                                 const Identity &caller,
                                                 const Bundle &bundle);

  /**
   * cancel_deal: pay(custodian -> buyer, price - reserve) + call when buyer is
   * recorded, call alone otherwise
   * @return refund to apply, none before any offer
   */
  outcome::result<boost::optional<Transfer>> validateCancelBundle(
      const Deal &deal, const Identity &caller, const Bundle &bundle);
}  // namespace rc::escrow
