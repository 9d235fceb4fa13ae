/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/outcome.hpp"
#include "primitives/types.hpp"
#include "storage/buffer_map.hpp"

namespace rc::ledger {
  using primitives::Identity;
  using primitives::TokenAmount;
  using storage::BufferBatch;

  /** Balance movement authorized by escrow guards */
  struct Transfer {
    Identity from;
    Identity to;
    TokenAmount amount{};
  };

  /** Escrow custodian accounts can only be debited through escrow */
  bool isCustodian(const Identity &account);

  /**
   * Account balances. Escrow state and balances share one storage, so a state
   * transition and its transfers are committed by a single batch.
   */
  class Ledger {
   public:
    virtual ~Ledger() = default;

    /** Balance of account, zero for unknown account */
    virtual outcome::result<TokenAmount> balance(
        const Identity &account) const = 0;

    /** Mint funds to account, faucet of test networks */
    virtual outcome::result<void> credit(const Identity &account,
                                         TokenAmount amount) = 0;

    /**
     * Wallet transfer signed by the sender
     * @return LedgerError::kCustodianLocked if sender is escrow custodian
     */
    virtual outcome::result<void> transfer(const Transfer &transfer) = 0;

    /**
     * Stage balance updates of transfers into batch, which already holds
     * escrow state changes, and commit it. On error nothing is committed.
     */
    virtual outcome::result<void> commit(
        BufferBatch &batch, const std::vector<Transfer> &transfers) = 0;
  };
}  // namespace rc::ledger
