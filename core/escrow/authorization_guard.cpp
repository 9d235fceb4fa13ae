/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/authorization_guard.hpp"

#include "escrow/escrow_error.hpp"

namespace rc::escrow {
  AuthorizationGuard::AuthorizationGuard(const Deal &deal) : deal_{deal} {}

  bool AuthorizationGuard::isSeller(const Identity &caller) const {
    return caller == deal_.seller;
  }

  bool AuthorizationGuard::isBuyer(const Identity &caller) const {
    return deal_.buyer && caller == *deal_.buyer;
  }

  bool AuthorizationGuard::isExpired(UnixTime now) const {
    return now >= deal_.deadline;
  }

  outcome::result<void> AuthorizationGuard::authorize(const Identity &caller,
                                                      Role role) const {
    bool allowed{false};
    switch (role) {
      case Role::kSeller:
        allowed = isSeller(caller);
        break;
      case Role::kBuyer:
        allowed = isBuyer(caller);
        break;
      case Role::kSellerOrBuyer:
        allowed = isSeller(caller) || isBuyer(caller);
        break;
      case Role::kAnyone:
        allowed = true;
        break;
    }
    if (!allowed) {
      return EscrowError::kUnauthorized;
    }
    return outcome::success();
  }

  outcome::result<void> AuthorizationGuard::authorizeCancel(
      const Identity &caller, UnixTime now) const {
    return authorize(caller,
                     isExpired(now) ? Role::kAnyone : Role::kSellerOrBuyer);
  }
}  // namespace rc::escrow
