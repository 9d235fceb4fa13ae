/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/endian.hpp>

#include "common/bytes.hpp"

namespace rc::common {
  inline void putUint64BigEndian(Bytes &l, uint64_t n) {
    l.resize(l.size() + sizeof(n));
    boost::endian::store_big_u64(&(*(l.end() - sizeof(n))), n);
  }

  /** Expects at least 8 bytes */
  inline uint64_t decodeBE(BytesIn bytes) {
    return boost::endian::load_big_u64(bytes.data());
  }
}  // namespace rc::common
