/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/outcome/outcome.hpp>

/**
 * Errors are reported as outcome::result<T>.
 * Each module declares an error enum with OUTCOME_HPP_DECLARE_ERROR and
 * defines its messages with OUTCOME_CPP_DEFINE_CATEGORY, callers propagate
 * with OUTCOME_TRY.
 */
namespace rc::outcome {
  using libp2p::outcome::failure;
  using libp2p::outcome::result;
  using libp2p::outcome::success;
}  // namespace rc::outcome
