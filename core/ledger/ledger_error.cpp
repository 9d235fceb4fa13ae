/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/ledger_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rc::ledger, LedgerError, e) {
  using E = rc::ledger::LedgerError;
  switch (e) {
    case E::kInsufficientFunds:
      return "Insufficient funds";
    case E::kCustodianLocked:
      return "Custodian funds are released only by escrow";
    case E::kOverflow:
      return "Balance overflow";
    case E::kInvalidAmount:
      return "Amount must be positive";
    case E::kCorruptedBalance:
      return "Stored balance is malformed";
  }
  return "Unknown error";
}
