/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "const.hpp"

#define DEFINE(x) \
  decltype(x) x  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

namespace rc {
  // Initialize parameters with mainnet values
  DEFINE(kDealWindow){30 * kSecondsInDay};
  DEFINE(kPayoutReserve){100};

  void setParamsMainnet() {
    kDealWindow = clock::UnixTime{30 * kSecondsInDay};
    kPayoutReserve = 100;
  }

  void setParamsDevnet() {
    kDealWindow = clock::UnixTime{10 * kSecondsInMinute};
    kPayoutReserve = 100;
  }
}  // namespace rc
