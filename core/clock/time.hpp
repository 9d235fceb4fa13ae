/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include "common/outcome.hpp"

namespace rc::clock {
  enum class TimeFromStringError { kInvalidFormat = 1 };

  using UnixTime = std::chrono::seconds;

  /** 9999-12-31T23:59:59Z, last second with four-digit year */
  constexpr UnixTime kMaxUnixTime{253402300799};

  /** Time in [epoch, kMaxUnixTime] */
  inline bool isRepresentable(UnixTime time) {
    return time >= UnixTime::zero() && time <= kMaxUnixTime;
  }

  /**
   * Formats as "YYYY-MM-DDTHH:MM:SSZ", times that are not representable as
   * decimal count of seconds. Never throws.
   */
  std::string unixTimeToString(UnixTime);

  /**
   * Parses either "YYYY-MM-DDTHH:MM:SSZ" or a decimal count of seconds since
   * unix epoch
   */
  outcome::result<UnixTime> unixTimeFromString(const std::string &str);
}  // namespace rc::clock

OUTCOME_HPP_DECLARE_ERROR(rc::clock, TimeFromStringError);
