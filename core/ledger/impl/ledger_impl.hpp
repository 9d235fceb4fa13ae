/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>

#include "common/logger.hpp"
#include "ledger/ledger.hpp"
#include "storage/map_prefix/prefix.hpp"

namespace rc::ledger {
  using storage::MapPtr;

  /**
   * Ledger keeping balances under "balance/" prefix of the storage
   */
  class LedgerImpl : public Ledger {
   public:
    explicit LedgerImpl(MapPtr storage);

    outcome::result<TokenAmount> balance(
        const Identity &account) const override;

    outcome::result<void> credit(const Identity &account,
                                 TokenAmount amount) override;

    outcome::result<void> transfer(const Transfer &transfer) override;

    outcome::result<void> commit(
        BufferBatch &batch, const std::vector<Transfer> &transfers) override;

   private:
    using Balances = std::map<Identity, TokenAmount>;

    outcome::result<TokenAmount> loadBalance(const Identity &account) const;
    outcome::result<void> stageLocked(BufferBatch &batch,
                                      const std::vector<Transfer> &transfers);
    outcome::result<TokenAmount> cached(Balances &balances,
                                        const Identity &account) const;

    MapPtr storage_;
    storage::MapPrefix balances_;
    mutable std::mutex mutex_;
    common::Logger logger_;
  };
}  // namespace rc::ledger
