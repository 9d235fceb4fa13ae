/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace rc::common {

  enum class UnhexError {
    kNonHexInput = 1,
    kNotEnoughInput,
  };

  /**
   * @brief Converts bytes to lowercase hex representation
   */
  std::string hex_lower(BytesIn bytes);

  /**
   * @brief Converts hex representation to bytes, "0x" prefix is accepted
   * @return UnhexError for odd length or non-hex characters
   */
  outcome::result<Bytes> unhex(std::string_view hex);
}  // namespace rc::common

OUTCOME_HPP_DECLARE_ERROR(rc::common, UnhexError);
