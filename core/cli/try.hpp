/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "common/outcome.hpp"
#include "common/outcome_fmt.hpp"

namespace rc::cli {
  struct CliError : std::runtime_error {
    template <typename... Args>
    CliError(const std::string_view &format, const Args &...args)
        : runtime_error{fmt::format(fmt::runtime(format), args...)} {}
  };

  /**
   * Unwraps result or throws CliError with formatted context and error
   */
  template <typename R, typename... Args>
  auto cliTry(outcome::result<R> &&o,
              const std::string_view &format,
              const Args &...args) {
    if (o) {
      if constexpr (!std::is_void_v<R>) {
        return std::move(o).value();
      } else {
        return;
      }
    }
    throw CliError{
        "{}: {:#}", fmt::format(fmt::runtime(format), args...), o.error()};
  }
}  // namespace rc::cli
