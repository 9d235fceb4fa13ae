/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options.hpp>

#include "clock/time.hpp"

namespace rc::config {
  using boost::program_options::options_description;

  /**
   * Parses deal window, plain seconds or number with one of suffixes
   * "s", "m", "h", "d"
   * @return none for malformed or zero duration
   */
  boost::optional<clock::UnixTime> parseDuration(const std::string &str);

  /**
   * Creates program option description for 'profile', 'deal-window' and
   * 'payout-reserve' and initialize parameters according to them. Explicit
   * 'deal-window' and 'payout-reserve' take precedence over the profile.
   *
   * @return profile program option description
   */
  options_description configProfile();
}  // namespace rc::config
