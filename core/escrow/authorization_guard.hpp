/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "escrow/deal.hpp"

namespace rc::escrow {

  enum class Role {
    kSeller,
    kBuyer,
    kSellerOrBuyer,
    kAnyone,
  };

  /**
   * Resolves caller role against parties recorded in deal snapshot
   */
  class AuthorizationGuard {
   public:
    explicit AuthorizationGuard(const Deal &deal);

    /**
     * @return EscrowError::kUnauthorized if caller does not have role, buyer
     * role is never satisfied before an offer is recorded
     */
    outcome::result<void> authorize(const Identity &caller, Role role) const;

    /**
     * Cancellation is open to anyone once the deadline is reached, so a deal
     * never stays locked when a party disappears
     */
    outcome::result<void> authorizeCancel(const Identity &caller,
                                          UnixTime now) const;

    bool isExpired(UnixTime now) const;

   private:
    bool isSeller(const Identity &caller) const;
    bool isBuyer(const Identity &caller) const;

    const Deal &deal_;
  };
}  // namespace rc::escrow
