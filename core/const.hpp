/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "clock/time.hpp"
#include "primitives/types.hpp"

namespace rc {
  using primitives::TokenAmount;

  constexpr int64_t kSecondsInMinute{60};
  constexpr int64_t kSecondsInHour{60 * kSecondsInMinute};
  constexpr int64_t kSecondsInDay{24 * kSecondsInHour};

  /** Custodian addresses are "<prefix><deal id>" */
  constexpr std::string_view kCustodianPrefix{"escrow-custodian-"};

  /** Period after listing creation while offer and confirmation are allowed */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  extern clock::UnixTime kDealWindow;

  /**
   * Amount withheld from every custodian payout, keeps custodian account above
   * the ledger minimum balance
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  extern TokenAmount kPayoutReserve;

  void setParamsMainnet();
  void setParamsDevnet();
}  // namespace rc
