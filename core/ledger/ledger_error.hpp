/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace rc::ledger {

  enum class LedgerError {
    kInsufficientFunds = 1,
    kCustodianLocked,
    kOverflow,
    kInvalidAmount,
    kCorruptedBalance,
  };

}  // namespace rc::ledger

OUTCOME_HPP_DECLARE_ERROR(rc::ledger, LedgerError);
