/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/escrow_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rc::escrow, EscrowError, e) {
  using E = rc::escrow::EscrowError;
  switch (e) {
    case E::kUnauthorized:
      return "Caller is not allowed to perform this action";
    case E::kDealNotActive:
      return "Deal is not active";
    case E::kDealNotPending:
      return "Deal has no pending offer";
    case E::kDealNotCancellable:
      return "Deal is already completed or cancelled";
    case E::kDealExpired:
      return "Deal deadline has passed";
    case E::kBundleMismatch:
      return "Bundle does not match the action";
    case E::kNotFound:
      return "Not found";
    case E::kInvalidPrice:
      return "Price must exceed the payout reserve";
    case E::kInvalidArgument:
      return "Invalid argument";
    case E::kPropertyHashMismatch:
      return "Property hash does not match the listing";
    case E::kUnknownAction:
      return "Unknown action";
    case E::kStateCorrupted:
      return "Stored deal state is malformed";
  }
  return "Unknown error";
}
