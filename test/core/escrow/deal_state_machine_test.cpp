/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/deal_state_machine.hpp"

#include <gtest/gtest.h>

#include "core/escrow/fixture.hpp"
#include "escrow/bundle_validator.hpp"
#include "escrow/escrow_error.hpp"
#include "testutil/outcome.hpp"

using namespace rc::escrow;
using namespace rc::escrow::fixture;
using rc::kCustodianPrefix;
using rc::kDealWindow;
using rc::kPayoutReserve;

struct DealStateMachineTest : public ::testing::Test {
  Deal active{activeDeal()};
  Deal pending{pendingDeal()};
  Identity custodian{custodianOf(1)};
  UnixTime expired{active.deadline};

  static Deal withStatus(Deal deal, DealStatus status) {
    deal.status = status;
    return deal;
  }

  Bundle payout(const Deal &deal, const Bytes &hash = {}) {
    return payoutBundle(deal, kSeller, hash).value();
  }

  Bundle cancel(const Deal &deal, const Identity &caller) {
    return cancelBundle(deal, caller).value();
  }
};

/**
 * @given valid listing arguments
 * @when create listing
 * @then active deal without buyer, deadline is now plus window
 */
TEST_F(DealStateMachineTest, CreateListing) {
  EXPECT_OUTCOME_TRUE(deal, createListing(1, kSeller, kPrice, kHash, kNow));
  EXPECT_EQ(deal, active);
  EXPECT_EQ(deal.status, DealStatus::kActive);
  EXPECT_FALSE(deal.buyer);
  EXPECT_EQ(deal.deadline, kNow + kDealWindow);
}

/**
 * @given invalid listing arguments
 * @when create listing
 * @then kInvalidPrice or kInvalidArgument
 */
TEST_F(DealStateMachineTest, CreateListingInvalid) {
  EXPECT_OUTCOME_ERROR(EscrowError::kInvalidPrice,
                       createListing(1, kSeller, kPayoutReserve, kHash, kNow));
  EXPECT_OUTCOME_ERROR(EscrowError::kInvalidPrice,
                       createListing(1, kSeller, 0, kHash, kNow));
  EXPECT_OUTCOME_ERROR(EscrowError::kInvalidArgument,
                       createListing(1, kSeller, kPrice, {}, kNow));
  EXPECT_OUTCOME_ERROR(EscrowError::kInvalidArgument,
                       createListing(1, "", kPrice, kHash, kNow));
  EXPECT_OUTCOME_ERROR(
      EscrowError::kInvalidArgument,
      createListing(
          1, std::string{kCustodianPrefix} + "7", kPrice, kHash, kNow));
}

/**
 * @given now so large that deadline overflows or leaves year 9999
 * @when create listing
 * @then kInvalidArgument, last now with representable deadline accepted
 */
TEST_F(DealStateMachineTest, CreateListingTimeOutOfRange) {
  for (const auto now : {UnixTime::max(),
                         UnixTime{9223372036854775000},
                         UnixTime{300000000000},
                         rc::clock::kMaxUnixTime,
                         rc::clock::kMaxUnixTime - kDealWindow + UnixTime{1},
                         UnixTime{-1},
                         UnixTime::min()}) {
    EXPECT_OUTCOME_ERROR(EscrowError::kInvalidArgument,
                         createListing(1, kSeller, kPrice, kHash, now));
  }
  const auto last{rc::clock::kMaxUnixTime - kDealWindow};
  EXPECT_OUTCOME_TRUE(deal, createListing(1, kSeller, kPrice, kHash, last));
  EXPECT_EQ(deal.deadline, rc::clock::kMaxUnixTime);
}

/**
 * @given window that cannot produce representable deadline
 * @when create listing
 * @then kInvalidArgument
 */
TEST_F(DealStateMachineTest, CreateListingWindowOutOfRange) {
  const auto saved{kDealWindow};
  for (const auto window : {UnixTime::max(), UnixTime::zero(), UnixTime{-1}}) {
    kDealWindow = window;
    EXPECT_OUTCOME_ERROR(EscrowError::kInvalidArgument,
                         createListing(1, kSeller, kPrice, kHash, kNow));
  }
  kDealWindow = saved;
}

/**
 * @given listing created under one reserve
 * @when reserve parameter changes afterwards
 * @then deal keeps reserve from creation, payout unchanged
 */
TEST_F(DealStateMachineTest, CreateListingKeepsReserve) {
  const auto saved{kPayoutReserve};
  EXPECT_OUTCOME_TRUE(deal, createListing(1, kSeller, kPrice, kHash, kNow));
  EXPECT_EQ(deal.reserve, saved);
  kPayoutReserve = kPrice;
  EXPECT_OUTCOME_EQ(payoutAmount(deal), kPrice - saved);
  kPayoutReserve = saved;
}

/**
 * @given active deal
 * @when buyer makes offer with deposit bundle
 * @then pending with buyer recorded, deposit to custodian
 */
TEST_F(DealStateMachineTest, MakeOffer) {
  EXPECT_OUTCOME_TRUE(
      transition,
      makeOffer(active, kBuyer, offerBundle(active, kBuyer), kNow));
  EXPECT_EQ(transition.deal, pending);
  ASSERT_EQ(transition.transfers.size(), 1);
  EXPECT_EQ(transition.transfers[0].from, kBuyer);
  EXPECT_EQ(transition.transfers[0].to, custodian);
  EXPECT_EQ(transition.transfers[0].amount, kPrice);
}

/**
 * @given active deal
 * @when seller or custodian makes offer
 * @then kUnauthorized
 */
TEST_F(DealStateMachineTest, MakeOfferOwnListing) {
  EXPECT_OUTCOME_ERROR(
      EscrowError::kUnauthorized,
      makeOffer(active, kSeller, offerBundle(active, kSeller), kNow));
  EXPECT_OUTCOME_ERROR(
      EscrowError::kUnauthorized,
      makeOffer(active, custodian, offerBundle(active, custodian), kNow));
}

/**
 * @given deals in every status but active
 * @when make offer
 * @then kDealNotActive
 */
TEST_F(DealStateMachineTest, MakeOfferNotActive) {
  for (auto status : {DealStatus::kPending,
                      DealStatus::kCompleted,
                      DealStatus::kCancelled}) {
    const auto deal{withStatus(pending, status)};
    EXPECT_OUTCOME_ERROR(
        EscrowError::kDealNotActive,
        makeOffer(deal, kStranger, offerBundle(deal, kStranger), kNow));
  }
}

/**
 * @given active deal past deadline
 * @when make offer, even with wrong bundle
 * @then kDealExpired, deadline is checked before bundle
 */
TEST_F(DealStateMachineTest, MakeOfferExpired) {
  EXPECT_OUTCOME_ERROR(
      EscrowError::kDealExpired,
      makeOffer(active, kBuyer, offerBundle(active, kBuyer), expired));
  EXPECT_OUTCOME_ERROR(EscrowError::kDealExpired,
                       makeOffer(active, kBuyer, {}, expired));
  EXPECT_OUTCOME_TRUE_1(makeOffer(active,
                                  kBuyer,
                                  offerBundle(active, kBuyer),
                                  expired - UnixTime{1}));
}

/**
 * @given active deal
 * @when offer deposits less than price
 * @then kBundleMismatch
 */
TEST_F(DealStateMachineTest, MakeOfferUnderpaid) {
  auto bundle{offerBundle(active, kBuyer)};
  boost::get<Payment>(bundle[0]).amount = kPrice - 1;
  EXPECT_OUTCOME_ERROR(EscrowError::kBundleMismatch,
                       makeOffer(active, kBuyer, bundle, kNow));
}

/**
 * @given pending deal
 * @when seller confirms with payout bundle
 * @then completed, payout from custodian to seller
 */
TEST_F(DealStateMachineTest, ConfirmTransfer) {
  EXPECT_OUTCOME_TRUE(
      transition, confirmTransfer(pending, kSeller, payout(pending), kNow));
  EXPECT_EQ(transition.deal,
            withStatus(pending, DealStatus::kCompleted));
  ASSERT_EQ(transition.transfers.size(), 1);
  EXPECT_EQ(transition.transfers[0].from, custodian);
  EXPECT_EQ(transition.transfers[0].to, kSeller);
  EXPECT_EQ(transition.transfers[0].amount, kPrice - kPayoutReserve);
}

/**
 * @given pending deal
 * @when seller attaches property hash to confirmation
 * @then accepted for recorded hash, kPropertyHashMismatch otherwise
 */
TEST_F(DealStateMachineTest, ConfirmPropertyHash) {
  EXPECT_OUTCOME_TRUE_1(
      confirmTransfer(pending, kSeller, payout(pending, kHash), kNow));
  EXPECT_OUTCOME_ERROR(
      EscrowError::kPropertyHashMismatch,
      confirmTransfer(pending, kSeller, payout(pending, {0xde, 0xad}), kNow));
}

/**
 * @given pending deal
 * @when buyer or stranger confirms
 * @then kUnauthorized
 */
TEST_F(DealStateMachineTest, ConfirmNotSeller) {
  for (const auto &caller : {kBuyer, kStranger}) {
    auto bundle{payout(pending)};
    boost::get<AppCall>(bundle.back()).sender = caller;
    EXPECT_OUTCOME_ERROR(EscrowError::kUnauthorized,
                         confirmTransfer(pending, caller, bundle, kNow));
  }
}

/**
 * @given deals not pending
 * @when anyone confirms
 * @then kDealNotPending, status is checked before caller
 */
TEST_F(DealStateMachineTest, ConfirmNotPending) {
  EXPECT_OUTCOME_ERROR(
      EscrowError::kDealNotPending,
      confirmTransfer(active, kSeller, payout(pending), kNow));
  const auto completed{withStatus(pending, DealStatus::kCompleted)};
  EXPECT_OUTCOME_ERROR(
      EscrowError::kDealNotPending,
      confirmTransfer(completed, kStranger, payout(pending), kNow));
}

/**
 * @given pending deal past deadline
 * @when seller confirms
 * @then kDealExpired
 */
TEST_F(DealStateMachineTest, ConfirmExpired) {
  EXPECT_OUTCOME_ERROR(
      EscrowError::kDealExpired,
      confirmTransfer(pending, kSeller, payout(pending), expired));
}

/**
 * @given active deal
 * @when seller cancels with call alone
 * @then cancelled without transfers
 */
TEST_F(DealStateMachineTest, CancelActive) {
  EXPECT_OUTCOME_TRUE(
      transition,
      cancelDeal(active, kSeller, cancel(active, kSeller), kNow));
  EXPECT_EQ(transition.deal, withStatus(active, DealStatus::kCancelled));
  EXPECT_TRUE(transition.transfers.empty());
}

/**
 * @given pending deal
 * @when seller or buyer cancels with refund bundle
 * @then cancelled, refund of price minus reserve to buyer
 */
TEST_F(DealStateMachineTest, CancelPending) {
  for (const auto &caller : {kSeller, kBuyer}) {
    EXPECT_OUTCOME_TRUE(
        transition,
        cancelDeal(pending, caller, cancel(pending, caller), kNow));
    EXPECT_EQ(transition.deal, withStatus(pending, DealStatus::kCancelled));
    ASSERT_EQ(transition.transfers.size(), 1);
    EXPECT_EQ(transition.transfers[0].from, custodian);
    EXPECT_EQ(transition.transfers[0].to, kBuyer);
    EXPECT_EQ(transition.transfers[0].amount, kPrice - kPayoutReserve);
  }
}

/**
 * @given pending deal
 * @when stranger cancels before and after deadline
 * @then kUnauthorized before, refund to buyer after
 */
TEST_F(DealStateMachineTest, CancelByStranger) {
  const auto bundle{cancel(pending, kStranger)};
  EXPECT_OUTCOME_ERROR(EscrowError::kUnauthorized,
                       cancelDeal(pending, kStranger, bundle, kNow));
  EXPECT_OUTCOME_TRUE(transition,
                      cancelDeal(pending, kStranger, bundle, expired));
  EXPECT_EQ(transition.deal.status, DealStatus::kCancelled);
  ASSERT_EQ(transition.transfers.size(), 1);
  EXPECT_EQ(transition.transfers[0].to, kBuyer);
}

/**
 * @given terminal deals
 * @when anyone cancels
 * @then kDealNotCancellable
 */
TEST_F(DealStateMachineTest, CancelTerminal) {
  for (auto status : {DealStatus::kCompleted, DealStatus::kCancelled}) {
    const auto deal{withStatus(pending, status)};
    EXPECT_OUTCOME_ERROR(EscrowError::kDealNotCancellable,
                         cancelDeal(deal, kBuyer, cancel(deal, kBuyer), kNow));
    EXPECT_OUTCOME_ERROR(
        EscrowError::kDealNotCancellable,
        cancelDeal(deal, kStranger, cancel(deal, kStranger), expired));
  }
}

/**
 * @given pending deal
 * @when cancel without refund payment
 * @then kBundleMismatch
 */
TEST_F(DealStateMachineTest, CancelPendingWithoutRefund) {
  EXPECT_OUTCOME_ERROR(
      EscrowError::kBundleMismatch,
      cancelDeal(pending, kBuyer, cancel(active, kBuyer), kNow));
}
