/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/deal_state_machine.hpp"

#include "const.hpp"
#include "escrow/authorization_guard.hpp"
#include "escrow/bundle_validator.hpp"
#include "escrow/escrow_error.hpp"

namespace rc::escrow {

  outcome::result<Deal> createListing(DealId deal_id,
                                      const Identity &caller,
                                      TokenAmount price,
                                      const Bytes &property_hash,
                                      UnixTime now) {
    if (caller.empty() || ledger::isCustodian(caller)
        || property_hash.empty()) {
      return EscrowError::kInvalidArgument;
    }
    // deadline must stay representable, window bounds are checked first so
    // kMaxUnixTime - kDealWindow cannot overflow
    if (kDealWindow <= UnixTime::zero() || kDealWindow > clock::kMaxUnixTime
        || !clock::isRepresentable(now)
        || now > clock::kMaxUnixTime - kDealWindow) {
      return EscrowError::kInvalidArgument;
    }
    if (price <= kPayoutReserve) {
      return EscrowError::kInvalidPrice;
    }
    Deal deal;
    deal.id = deal_id;
    deal.seller = caller;
    deal.price = price;
    deal.reserve = kPayoutReserve;
    deal.property_hash = property_hash;
    deal.created_at = now;
    deal.deadline = now + kDealWindow;
    deal.status = DealStatus::kActive;
    return std::move(deal);
  }

  outcome::result<Transition> makeOffer(const Deal &deal,
                                        const Identity &caller,
                                        const Bundle &bundle,
                                        UnixTime now) {
    if (deal.status != DealStatus::kActive) {
      return EscrowError::kDealNotActive;
    }
    const AuthorizationGuard guard{deal};
    // seller cannot buy own listing, custodians never sign
    if (guard.authorize(caller, Role::kSeller) || ledger::isCustodian(caller)) {
      return EscrowError::kUnauthorized;
    }
    if (guard.isExpired(now)) {
      return EscrowError::kDealExpired;
    }
    OUTCOME_TRY(deposit, validateOfferBundle(deal, caller, bundle));

    Transition transition{deal, {std::move(deposit)}};
    transition.deal.buyer = caller;
    transition.deal.status = DealStatus::kPending;
    return std::move(transition);
  }

  outcome::result<Transition> confirmTransfer(const Deal &deal,
                                              const Identity &caller,
                                              const Bundle &bundle,
                                              UnixTime now) {
    if (deal.status != DealStatus::kPending) {
      return EscrowError::kDealNotPending;
    }
    const AuthorizationGuard guard{deal};
    OUTCOME_TRY(guard.authorize(caller, Role::kSeller));
    // after the deadline only cancellation can release custody
    if (guard.isExpired(now)) {
      return EscrowError::kDealExpired;
    }
    OUTCOME_TRY(payout, validatePayoutBundle(deal, caller, bundle));

    Transition transition{deal, {std::move(payout)}};
    transition.deal.status = DealStatus::kCompleted;
    return std::move(transition);
  }

  outcome::result<Transition> cancelDeal(const Deal &deal,
                                         const Identity &caller,
                                         const Bundle &bundle,
                                         UnixTime now) {
    if (deal.isTerminal()) {
      return EscrowError::kDealNotCancellable;
    }
    const AuthorizationGuard guard{deal};
    OUTCOME_TRY(guard.authorizeCancel(caller, now));
    OUTCOME_TRY(refund, validateCancelBundle(deal, caller, bundle));

    Transition transition{deal, {}};
    if (refund) {
      transition.transfers.push_back(std::move(*refund));
    }
    transition.deal.status = DealStatus::kCancelled;
    return std::move(transition);
  }
}  // namespace rc::escrow
