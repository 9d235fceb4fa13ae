/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/time.hpp"

namespace rc::clock {
  /**
   * Source of wall time for actions which do not carry their own timestamp
   */
  class UTCClock {
   public:
    virtual ~UTCClock() = default;

    /** Whole seconds since unix epoch */
    virtual UnixTime nowUTC() const = 0;
  };
}  // namespace rc::clock
