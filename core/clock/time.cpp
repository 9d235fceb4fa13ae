/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/time.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/lexical_cast.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(rc::clock, TimeFromStringError, e) {
  using rc::clock::TimeFromStringError;
  if (e == TimeFromStringError::kInvalidFormat) {
    return "Input has invalid format";
  }
  return "Unknown error";
}

namespace rc::clock {
  const static boost::posix_time::ptime kPtimeUnixZero(
      boost::gregorian::date(1970, 1, 1));

  std::string unixTimeToString(UnixTime time) {
    if (!isRepresentable(time)) {
      return std::to_string(time.count());
    }
    return boost::posix_time::to_iso_extended_string(
               kPtimeUnixZero + boost::posix_time::seconds{time.count()})
           + "Z";
  }

  outcome::result<UnixTime> unixTimeFromString(const std::string &str) {
    if (!str.empty() && boost::algorithm::all(str, [](char c) {
          return c >= '0' && c <= '9';
        })) {
      try {
        return UnixTime{boost::lexical_cast<int64_t>(str)};
      } catch (const boost::bad_lexical_cast &) {
        return TimeFromStringError::kInvalidFormat;
      }
    }
    if (str.size() != 20 || str.back() != 'Z') {
      return TimeFromStringError::kInvalidFormat;
    }
    boost::posix_time::ptime ptime;
    try {
      ptime = boost::posix_time::from_iso_extended_string(
          str.substr(0, str.size() - 1));
    } catch (const std::exception &) {
      return TimeFromStringError::kInvalidFormat;
    }
    if (ptime.is_not_a_date_time()) {
      return TimeFromStringError::kInvalidFormat;
    }
    const UnixTime time{(ptime - kPtimeUnixZero).total_seconds()};
    if (!isRepresentable(time)) {
      return TimeFromStringError::kInvalidFormat;
    }
    return time;
  }
}  // namespace rc::clock
