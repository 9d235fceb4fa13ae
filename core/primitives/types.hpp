/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

namespace rc::primitives {
  /** Amount in micro-units of the ledger currency */
  using TokenAmount = uint64_t;

  using DealId = uint64_t;

  /** Account address as issued by the wallet */
  using Identity = std::string;
}  // namespace rc::primitives
