/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/bundle_validator.hpp"

#include "escrow/escrow_error.hpp"

namespace rc::escrow {
  namespace {
    /**
     * Bundle must be [payment, call], payment matching exactly
     */
    outcome::result<Transfer> expectPayment(const Bundle &bundle,
                                            const Identity &sender,
                                            const Identity &receiver,
                                            TokenAmount amount) {
      if (bundle.size() != 2) {
        return EscrowError::kBundleMismatch;
      }
      const auto *payment{boost::get<Payment>(&bundle.front())};
      if (payment == nullptr || payment->sender != sender
          || payment->receiver != receiver || payment->amount != amount) {
        return EscrowError::kBundleMismatch;
      }
      return Transfer{payment->sender, payment->receiver, payment->amount};
    }
  }  // namespace

  outcome::result<TokenAmount> payoutAmount(const Deal &deal) {
    if (deal.price <= deal.reserve) {
      return EscrowError::kInvalidPrice;
    }
    return deal.price - deal.reserve;
  }

  outcome::result<const AppCall *> validateCall(const Deal &deal,
                                                const Identity &caller,
                                                std::string_view method,
                                                const Bundle &bundle) {
    if (bundle.empty()) {
      return EscrowError::kBundleMismatch;
    }
    const auto *call{boost::get<AppCall>(&bundle.back())};
    if (call == nullptr || call->sender != caller || call->deal_id != deal.id
        || call->method != method) {
      return EscrowError::kBundleMismatch;
    }
    return call;
  }

  outcome::result<Transfer> validateOfferBundle(const Deal &deal,
                                                const Identity &caller,
                                                const Bundle &bundle) {
    OUTCOME_TRY(validateCall(deal, caller, method::kMakeOffer, bundle));
    return expectPayment(bundle, caller, custodianOf(deal.id), deal.price);
  }

  outcome::result<Transfer> validatePayoutBundle(const Deal &deal,
                                                 const Identity &caller,
                                                 const Bundle &bundle) {
    OUTCOME_TRY(call,
                validateCall(deal, caller, method::kConfirmTransfer, bundle));
    if (!call->args.empty() && call->args.front() != deal.property_hash) {
      return EscrowError::kPropertyHashMismatch;
    }
    OUTCOME_TRY(amount, payoutAmount(deal));
    return expectPayment(bundle, custodianOf(deal.id), deal.seller, amount);
  }

  outcome::result<boost::optional<Transfer>> validateCancelBundle(
      const Deal &deal, const Identity &caller, const Bundle &bundle) {
    OUTCOME_TRY(validateCall(deal, caller, method::kCancelDeal, bundle));
    if (!deal.buyer) {
      if (bundle.size() != 1) {
        return EscrowError::kBundleMismatch;
      }
      return boost::none;
    }
    OUTCOME_TRY(amount, payoutAmount(deal));
    OUTCOME_TRY(refund,
                expectPayment(bundle, custodianOf(deal.id), *deal.buyer, amount));
    return refund;
  }
}  // namespace rc::escrow
