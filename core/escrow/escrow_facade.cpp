/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/escrow_facade.hpp"

#include "common/endian.hpp"
#include "common/outcome_fmt.hpp"
#include "escrow/escrow_error.hpp"
#include "escrow/state_store.hpp"

namespace rc::escrow {
  namespace {
    constexpr DealId kFirstDealId{1};
  }  // namespace

  EscrowFacade::EscrowFacade(MapPtr storage,
                             std::shared_ptr<ledger::Ledger> ledger)
      : storage_{storage},
        ledger_{std::move(ledger)},
        next_deal_id_{"escrow/next_deal_id", storage},
        logger_{common::createLogger("escrow")} {}

  outcome::result<DealId> EscrowFacade::nextDealId() const {
    OUTCOME_TRY(raw, next_deal_id_.tryGet());
    if (!raw) {
      return kFirstDealId;
    }
    if (raw->size() != sizeof(DealId)) {
      return EscrowError::kStateCorrupted;
    }
    return common::decodeBE(*raw);
  }

  std::mutex &EscrowFacade::dealMutex(DealId deal_id) {
    return deal_mutexes_[deal_id % kDealLockStripes];
  }

  outcome::result<Deal> EscrowFacade::createListing(
      const Identity &caller,
      TokenAmount price,
      const Bytes &property_hash,
      UnixTime now) {
    std::lock_guard lock{create_mutex_};
    OUTCOME_TRY(deal_id, nextDealId());
    auto deal{escrow::createListing(deal_id, caller, price, property_hash, now)};
    if (!deal) {
      logger_->debug("create_listing by {} rejected: {:#}", caller, deal.error());
      return deal.error();
    }

    auto batch{storage_->batch()};
    OUTCOME_TRY(StateStore(storage_, deal_id).stage(*batch, deal.value()));
    Bytes next;
    common::putUint64BigEndian(next, deal_id + 1);
    OUTCOME_TRY(batch->put(next_deal_id_.key, std::move(next)));
    OUTCOME_TRY(ledger_->commit(*batch, {}));

    logger_->info("deal {} listed by {} for {}, deadline {}",
                  deal_id,
                  caller,
                  price,
                  clock::unixTimeToString(deal.value().deadline));
    return deal;
  }

  outcome::result<Deal> EscrowFacade::apply(std::string_view name,
                                            DealId deal_id,
                                            Action action,
                                            const Identity &caller,
                                            const Bundle &bundle,
                                            UnixTime now) {
    std::lock_guard lock{dealMutex(deal_id)};
    const StateStore store{storage_, deal_id};
    OUTCOME_TRY(deal, store.load());

    auto transition{action(deal, caller, bundle, now)};
    if (!transition) {
      logger_->debug("{} on deal {} by {} rejected: {:#}",
                     name,
                     deal_id,
                     caller,
                     transition.error());
      return transition.error();
    }

    auto batch{storage_->batch()};
    OUTCOME_TRY(store.stage(*batch, transition.value().deal));
    auto committed{ledger_->commit(*batch, transition.value().transfers)};
    if (!committed) {
      logger_->warn("{} on deal {} by {} not committed: {:#}",
                    name,
                    deal_id,
                    caller,
                    committed.error());
      return committed.error();
    }

    logger_->info("deal {} {} by {}: {} -> {}",
                  deal_id,
                  name,
                  caller,
                  dealStatusName(deal.status),
                  dealStatusName(transition.value().deal.status));
    return std::move(transition.value().deal);
  }

  outcome::result<Deal> EscrowFacade::makeOffer(DealId deal_id,
                                                const Identity &caller,
                                                const Bundle &bundle,
                                                UnixTime now) {
    return apply(
        method::kMakeOffer, deal_id, &escrow::makeOffer, caller, bundle, now);
  }

  outcome::result<Deal> EscrowFacade::confirmTransfer(DealId deal_id,
                                                      const Identity &caller,
                                                      const Bundle &bundle,
                                                      UnixTime now) {
    return apply(method::kConfirmTransfer,
                 deal_id,
                 &escrow::confirmTransfer,
                 caller,
                 bundle,
                 now);
  }

  outcome::result<Deal> EscrowFacade::cancelDeal(DealId deal_id,
                                                 const Identity &caller,
                                                 const Bundle &bundle,
                                                 UnixTime now) {
    return apply(
        method::kCancelDeal, deal_id, &escrow::cancelDeal, caller, bundle, now);
  }

  outcome::result<Deal> EscrowFacade::readState(DealId deal_id) {
    std::lock_guard lock{dealMutex(deal_id)};
    return StateStore{storage_, deal_id}.load();
  }

  outcome::result<Deal> EscrowFacade::dispatch(std::string_view action,
                                               const ActionArgs &args,
                                               const Bundle &bundle,
                                               const Identity &caller,
                                               UnixTime now) {
    if (action == method::kCreateListing) {
      return createListing(caller, args.price, args.property_hash, now);
    }
    if (action == method::kMakeOffer) {
      return makeOffer(args.deal_id, caller, bundle, now);
    }
    if (action == method::kConfirmTransfer) {
      return confirmTransfer(args.deal_id, caller, bundle, now);
    }
    if (action == method::kCancelDeal) {
      return cancelDeal(args.deal_id, caller, bundle, now);
    }
    if (action == method::kReadState) {
      return readState(args.deal_id);
    }
    logger_->debug("unknown action '{}' from {}", action, caller);
    return EscrowError::kUnknownAction;
  }

  outcome::result<std::vector<DealId>> EscrowFacade::deals() const {
    OUTCOME_TRY(next, nextDealId());
    std::vector<DealId> ids;
    for (auto id{kFirstDealId}; id < next; ++id) {
      ids.push_back(id);
    }
    return ids;
  }

  const std::shared_ptr<ledger::Ledger> &EscrowFacade::ledger() const {
    return ledger_;
  }
}  // namespace rc::escrow
