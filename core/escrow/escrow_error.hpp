/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace rc::escrow {

  enum class EscrowError {
    kUnauthorized = 1,
    kDealNotActive,
    kDealNotPending,
    kDealNotCancellable,
    kDealExpired,
    kBundleMismatch,
    kNotFound,
    kInvalidPrice,
    kInvalidArgument,
    kPropertyHashMismatch,
    kUnknownAction,
    kStateCorrupted,
  };

}  // namespace rc::escrow

OUTCOME_HPP_DECLARE_ERROR(rc::escrow, EscrowError);
