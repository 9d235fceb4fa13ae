/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/bundle_validator.hpp"

#include <gtest/gtest.h>

#include "core/escrow/fixture.hpp"
#include "escrow/escrow_error.hpp"
#include "testutil/outcome.hpp"

using namespace rc::escrow;
using namespace rc::escrow::fixture;
using rc::kPayoutReserve;

struct BundleValidatorTest : public ::testing::Test {
  Deal active{activeDeal()};
  Deal pending{pendingDeal()};
  Identity custodian{custodianOf(1)};
  TokenAmount payout{kPrice - kPayoutReserve};

  static bool sameTransfer(const Transfer &transfer, const Payment &payment) {
    return transfer.from == payment.sender && transfer.to == payment.receiver
           && transfer.amount == payment.amount;
  }
};

/**
 * @given deal price and reserve
 * @when payout amount
 * @then price minus reserve, error when reserve takes everything
 */
TEST_F(BundleValidatorTest, PayoutAmount) {
  EXPECT_OUTCOME_EQ(payoutAmount(active), payout);
  auto cheap{active};
  cheap.price = cheap.reserve;
  EXPECT_OUTCOME_ERROR(EscrowError::kInvalidPrice, payoutAmount(cheap));
}

/**
 * @given correct offer bundle
 * @when validate
 * @then deposit of full price from caller to custodian
 */
TEST_F(BundleValidatorTest, OfferAccepted) {
  const auto bundle{offerBundle(active, kBuyer)};
  EXPECT_OUTCOME_TRUE(deposit, validateOfferBundle(active, kBuyer, bundle));
  EXPECT_TRUE(sameTransfer(deposit, Payment{kBuyer, custodian, kPrice}));
}

/**
 * @given offer bundles differing from expected one in single field
 * @when validate
 * @then kBundleMismatch
 */
TEST_F(BundleValidatorTest, OfferRejected) {
  const auto call{makeCall(active, kBuyer, method::kMakeOffer)};
  const std::vector<Bundle> bundles{
      {call},
      {Payment{kBuyer, custodian, kPrice - 1}, call},
      {Payment{kBuyer, custodian, kPrice + 1}, call},
      {Payment{kStranger, custodian, kPrice}, call},
      {Payment{kBuyer, kSeller, kPrice}, call},
      {Payment{kBuyer, custodianOf(2), kPrice}, call},
      {call, Payment{kBuyer, custodian, kPrice}},
      {Payment{kBuyer, custodian, kPrice},
       makeCall(active, kStranger, method::kMakeOffer)},
      {Payment{kBuyer, custodian, kPrice},
       makeCall(activeDeal(2), kBuyer, method::kMakeOffer)},
      {Payment{kBuyer, custodian, kPrice},
       makeCall(active, kBuyer, method::kCancelDeal)},
      {Payment{kBuyer, custodian, kPrice},
       Payment{kBuyer, custodian, kPrice},
       call},
      {},
  };
  for (const auto &bundle : bundles) {
    EXPECT_OUTCOME_ERROR(EscrowError::kBundleMismatch,
                         validateOfferBundle(active, kBuyer, bundle));
  }
}

/**
 * @given correct payout bundle with and without property hash
 * @when validate
 * @then payout of price minus reserve to seller
 */
TEST_F(BundleValidatorTest, PayoutAccepted) {
  EXPECT_OUTCOME_TRUE(bundle, payoutBundle(pending, kSeller));
  EXPECT_OUTCOME_TRUE(transfer, validatePayoutBundle(pending, kSeller, bundle));
  EXPECT_TRUE(sameTransfer(transfer, Payment{custodian, kSeller, payout}));

  EXPECT_OUTCOME_TRUE(with_hash, payoutBundle(pending, kSeller, kHash));
  EXPECT_OUTCOME_TRUE_1(validatePayoutBundle(pending, kSeller, with_hash));
}

/**
 * @given payout bundle carrying another property hash
 * @when validate
 * @then kPropertyHashMismatch
 */
TEST_F(BundleValidatorTest, PayoutHashMismatch) {
  EXPECT_OUTCOME_TRUE(bundle, payoutBundle(pending, kSeller, Bytes{1, 2}));
  EXPECT_OUTCOME_ERROR(EscrowError::kPropertyHashMismatch,
                       validatePayoutBundle(pending, kSeller, bundle));
}

/**
 * @given pending deal with reserve recorded at creation
 * @when reserve parameter is raised to the price
 * @then payout and refund still use recorded reserve
 */
TEST_F(BundleValidatorTest, StoredReserveUsed) {
  const auto saved{kPayoutReserve};
  kPayoutReserve = kPrice;
  EXPECT_OUTCOME_EQ(payoutAmount(pending), payout);
  EXPECT_OUTCOME_TRUE(bundle, cancelBundle(pending, kBuyer));
  EXPECT_OUTCOME_TRUE(refund, validateCancelBundle(pending, kBuyer, bundle));
  ASSERT_TRUE(refund);
  EXPECT_TRUE(sameTransfer(*refund, Payment{custodian, kBuyer, payout}));
  kPayoutReserve = saved;
}

/**
 * @given payout bundles with wrong amount, receiver or sender
 * @when validate
 * @then kBundleMismatch
 */
TEST_F(BundleValidatorTest, PayoutRejected) {
  const auto call{makeCall(pending, kSeller, method::kConfirmTransfer)};
  const std::vector<Bundle> bundles{
      {call},
      {Payment{custodian, kSeller, kPrice}, call},
      {Payment{custodian, kBuyer, payout}, call},
      {Payment{kBuyer, kSeller, payout}, call},
      {Payment{custodian, kSeller, payout},
       makeCall(pending, kSeller, method::kMakeOffer)},
  };
  for (const auto &bundle : bundles) {
    EXPECT_OUTCOME_ERROR(EscrowError::kBundleMismatch,
                         validatePayoutBundle(pending, kSeller, bundle));
  }
}

/**
 * @given deal without buyer
 * @when validate cancel bundle
 * @then call alone accepted without refund, any payment rejected
 */
TEST_F(BundleValidatorTest, CancelWithoutBuyer) {
  EXPECT_OUTCOME_TRUE(bundle, cancelBundle(active, kSeller));
  EXPECT_EQ(bundle.size(), 1);
  EXPECT_OUTCOME_TRUE(refund, validateCancelBundle(active, kSeller, bundle));
  EXPECT_FALSE(refund);

  const Bundle with_payment{Payment{custodian, kSeller, payout},
                            makeCall(active, kSeller, method::kCancelDeal)};
  EXPECT_OUTCOME_ERROR(EscrowError::kBundleMismatch,
                       validateCancelBundle(active, kSeller, with_payment));
}

/**
 * @given deal with buyer
 * @when validate cancel bundle
 * @then refund of price minus reserve to buyer is required
 */
TEST_F(BundleValidatorTest, CancelWithBuyer) {
  EXPECT_OUTCOME_TRUE(bundle, cancelBundle(pending, kSeller));
  EXPECT_OUTCOME_TRUE(refund, validateCancelBundle(pending, kSeller, bundle));
  ASSERT_TRUE(refund);
  EXPECT_TRUE(sameTransfer(*refund, Payment{custodian, kBuyer, payout}));

  const auto call{makeCall(pending, kSeller, method::kCancelDeal)};
  const std::vector<Bundle> bundles{
      {call},
      {Payment{custodian, kSeller, payout}, call},
      {Payment{custodian, kBuyer, kPrice}, call},
  };
  for (const auto &bad : bundles) {
    EXPECT_OUTCOME_ERROR(EscrowError::kBundleMismatch,
                         validateCancelBundle(pending, kSeller, bad));
  }
}
