/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/authorization_guard.hpp"

#include <gtest/gtest.h>

#include "core/escrow/fixture.hpp"
#include "escrow/escrow_error.hpp"
#include "testutil/outcome.hpp"

using namespace rc::escrow;
using namespace rc::escrow::fixture;

/**
 * @given deal before any offer
 * @when authorize each role
 * @then seller resolves, buyer role cannot be satisfied by anyone
 */
TEST(AuthorizationGuardTest, BeforeOffer) {
  const auto deal{activeDeal()};
  const AuthorizationGuard guard{deal};
  EXPECT_OUTCOME_TRUE_1(guard.authorize(kSeller, Role::kSeller));
  EXPECT_OUTCOME_TRUE_1(guard.authorize(kSeller, Role::kSellerOrBuyer));
  EXPECT_OUTCOME_ERROR(EscrowError::kUnauthorized,
                       guard.authorize(kBuyer, Role::kBuyer));
  EXPECT_OUTCOME_ERROR(EscrowError::kUnauthorized,
                       guard.authorize(kSeller, Role::kBuyer));
  EXPECT_OUTCOME_ERROR(EscrowError::kUnauthorized,
                       guard.authorize(kStranger, Role::kSellerOrBuyer));
  EXPECT_OUTCOME_TRUE_1(guard.authorize(kStranger, Role::kAnyone));
}

/**
 * @given deal with buyer recorded
 * @when authorize each role
 * @then buyer resolves for buyer roles only
 */
TEST(AuthorizationGuardTest, AfterOffer) {
  const auto deal{pendingDeal()};
  const AuthorizationGuard guard{deal};
  EXPECT_OUTCOME_TRUE_1(guard.authorize(kBuyer, Role::kBuyer));
  EXPECT_OUTCOME_TRUE_1(guard.authorize(kBuyer, Role::kSellerOrBuyer));
  EXPECT_OUTCOME_ERROR(EscrowError::kUnauthorized,
                       guard.authorize(kBuyer, Role::kSeller));
  EXPECT_OUTCOME_ERROR(EscrowError::kUnauthorized,
                       guard.authorize(kSeller, Role::kBuyer));
  EXPECT_OUTCOME_ERROR(EscrowError::kUnauthorized,
                       guard.authorize(kStranger, Role::kBuyer));
}

/**
 * @given deal
 * @when now approaches deadline
 * @then expired exactly from the deadline
 */
TEST(AuthorizationGuardTest, Expiry) {
  const auto deal{activeDeal()};
  const AuthorizationGuard guard{deal};
  EXPECT_FALSE(guard.isExpired(kNow));
  EXPECT_FALSE(guard.isExpired(deal.deadline - UnixTime{1}));
  EXPECT_TRUE(guard.isExpired(deal.deadline));
  EXPECT_TRUE(guard.isExpired(deal.deadline + UnixTime{1}));
}

/**
 * @given pending deal
 * @when stranger cancels before and after deadline
 * @then rejected before, accepted once deadline is reached
 */
TEST(AuthorizationGuardTest, CancelDeadlineOverride) {
  const auto deal{pendingDeal()};
  const AuthorizationGuard guard{deal};
  EXPECT_OUTCOME_TRUE_1(guard.authorizeCancel(kSeller, kNow));
  EXPECT_OUTCOME_TRUE_1(guard.authorizeCancel(kBuyer, kNow));
  EXPECT_OUTCOME_ERROR(EscrowError::kUnauthorized,
                       guard.authorizeCancel(kStranger, kNow));
  EXPECT_OUTCOME_TRUE_1(guard.authorizeCancel(kStranger, deal.deadline));
}
