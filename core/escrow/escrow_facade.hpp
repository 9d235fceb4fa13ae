/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <mutex>

#include "common/logger.hpp"
#include "escrow/deal_state_machine.hpp"
#include "ledger/ledger.hpp"
#include "storage/map_prefix/prefix.hpp"

namespace rc::escrow {
  using storage::MapPtr;

  /** Arguments of dispatched action, fields not used by action are ignored */
  struct ActionArgs {
    DealId deal_id{};
    TokenAmount price{};
    Bytes property_hash;
  };

  /**
   * Entry point of escrow. Each action loads fresh snapshot of the deal,
   * evaluates guards and commits new state with bundled transfers in one
   * batch. Actions on one deal are serialized by one of kDealLockStripes
   * locks, chosen by deal id.
   */
  class EscrowFacade {
   public:
    static constexpr size_t kDealLockStripes{64};

    EscrowFacade(MapPtr storage, std::shared_ptr<ledger::Ledger> ledger);

    outcome::result<Deal> createListing(const Identity &caller,
                                        TokenAmount price,
                                        const Bytes &property_hash,
                                        UnixTime now);

    outcome::result<Deal> makeOffer(DealId deal_id,
                                    const Identity &caller,
                                    const Bundle &bundle,
                                    UnixTime now);

    outcome::result<Deal> confirmTransfer(DealId deal_id,
                                          const Identity &caller,
                                          const Bundle &bundle,
                                          UnixTime now);

    outcome::result<Deal> cancelDeal(DealId deal_id,
                                     const Identity &caller,
                                     const Bundle &bundle,
                                     UnixTime now);

    /**
     * Side-effect free, callable by anyone
     * @return EscrowError::kNotFound for unknown deal
     */
    outcome::result<Deal> readState(DealId deal_id);

    /**
     * Route action by name
     * @return new snapshot, or kUnknownAction
     */
    outcome::result<Deal> dispatch(std::string_view action,
                                   const ActionArgs &args,
                                   const Bundle &bundle,
                                   const Identity &caller,
                                   UnixTime now);

    /** Ids of every created deal, in creation order */
    outcome::result<std::vector<DealId>> deals() const;

    const std::shared_ptr<ledger::Ledger> &ledger() const;

   private:
    using Action = outcome::result<Transition> (*)(const Deal &,
                                                    const Identity &,
                                                    const Bundle &,
                                                    UnixTime);

    outcome::result<Deal> apply(std::string_view name,
                                DealId deal_id,
                                Action action,
                                const Identity &caller,
                                const Bundle &bundle,
                                UnixTime now);

    outcome::result<DealId> nextDealId() const;

    std::mutex &dealMutex(DealId deal_id);

    MapPtr storage_;
    std::shared_ptr<ledger::Ledger> ledger_;
    storage::OneKey next_deal_id_;
    std::mutex create_mutex_;
    std::array<std::mutex, kDealLockStripes> deal_mutexes_;
    common::Logger logger_;
  };
}  // namespace rc::escrow
