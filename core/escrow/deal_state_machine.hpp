/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "escrow/bundle.hpp"
#include "ledger/ledger.hpp"

namespace rc::escrow {

  /**
   * Result of accepted action: new snapshot and the transfers which must be
   * committed atomically with it
   */
  struct Transition {
    Deal deal;
    std::vector<ledger::Transfer> transfers;
  };

  /*
   * Lifecycle:
   *   Active -> Pending -> Completed
   *      |         |
   *      +---------+----> Cancelled
   * Completed and Cancelled are terminal.
   *
   * Functions below evaluate every guard against the snapshot and never
   * mutate it, a failed action has no effect.
   */

  outcome::result<Deal> createListing(DealId deal_id,
                                      const Identity &caller,
                                      TokenAmount price,
                                      const Bytes &property_hash,
                                      UnixTime now);

  outcome::result<Transition> makeOffer(const Deal &deal,
                                        const Identity &caller,
                                        const Bundle &bundle,
                                        UnixTime now);

  outcome::result<Transition> confirmTransfer(const Deal &deal,
                                              const Identity &caller,
                                              const Bundle &bundle,
                                              UnixTime now);

  outcome::result<Transition> cancelDeal(const Deal &deal,
                                         const Identity &caller,
                                         const Bundle &bundle,
                                         UnixTime now);
}  // namespace rc::escrow
