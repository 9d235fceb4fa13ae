/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>
#include <vector>

namespace rc {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = gsl::span<const uint8_t>;

  inline Bytes copy(BytesIn r) {
    return {r.begin(), r.end()};
  }
  void copy(Bytes &&) = delete;

  inline void append(Bytes &l, BytesIn r) {
    l.insert(l.end(), r.begin(), r.end());
  }
}  // namespace rc

namespace rc::common::span {
  template <typename To, typename From>
  constexpr auto cast(From *ptr) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return reinterpret_cast<To *>(ptr);
  }

  template <typename To, typename From>
  constexpr auto cast(gsl::span<From> span) {
    static_assert(sizeof(To) == 1);
    return gsl::make_span(cast<To>(span.data()), span.size_bytes());
  }

  constexpr auto cbytes(std::string_view str) {
    return gsl::make_span(cast<const uint8_t>(str.data()), str.size());
  }

  constexpr auto bytestr(BytesIn span) {
    return std::string_view(cast<const char>(span.data()), span.size());
  }
}  // namespace rc::common::span
