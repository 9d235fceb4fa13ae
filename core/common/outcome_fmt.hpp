/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/fmt.h>
#include <system_error>

/**
 * "{}" prints "CATEGORY:VALUE", enough to grep logs.
 * "{:#}" adds the message, for errors shown to a user.
 */
template <>
struct fmt::formatter<std::error_code, char, void> {
  bool verbose{false};

  template <typename ParseContext>
  constexpr auto parse(ParseContext &ctx) {
    auto it{ctx.begin()};
    if (it != ctx.end() && *it == '#') {
      verbose = true;
      ++it;
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const std::error_code &e, FormatContext &ctx) const {
    auto out{fmt::format_to(
        ctx.out(), "{}:{}", e.category().name(), e.value())};
    if (verbose) {
      out = fmt::format_to(out, " {}", e.message());
    }
    return out;
  }
};
