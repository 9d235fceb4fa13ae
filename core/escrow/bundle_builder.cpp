/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/bundle_builder.hpp"

#include "escrow/bundle_validator.hpp"

namespace rc::escrow {
  AppCall makeCall(const Deal &deal,
                   const Identity &caller,
                   std::string_view method,
                   std::vector<Bytes> args) {
    return {caller, deal.id, std::string{method}, std::move(args)};
  }

  Bundle offerBundle(const Deal &deal, const Identity &buyer) {
    return {Payment{buyer, custodianOf(deal.id), deal.price},
            makeCall(deal, buyer, method::kMakeOffer)};
  }

  outcome::result<Bundle> payoutBundle(const Deal &deal,
                                       const Identity &seller,
                                       const Bytes &property_hash) {
    OUTCOME_TRY(amount, payoutAmount(deal));
    std::vector<Bytes> args;
    if (!property_hash.empty()) {
      args.push_back(property_hash);
    }
    return Bundle{
        Payment{custodianOf(deal.id), deal.seller, amount},
        makeCall(deal, seller, method::kConfirmTransfer, std::move(args))};
  }

  outcome::result<Bundle> cancelBundle(const Deal &deal,
                                       const Identity &caller) {
    Bundle bundle;
    if (deal.buyer) {
      OUTCOME_TRY(amount, payoutAmount(deal));
      bundle.emplace_back(Payment{custodianOf(deal.id), *deal.buyer, amount});
    }
    bundle.emplace_back(makeCall(deal, caller, method::kCancelDeal));
    return std::move(bundle);
  }
}  // namespace rc::escrow
