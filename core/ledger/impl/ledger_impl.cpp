/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/impl/ledger_impl.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <limits>

#include "common/endian.hpp"
#include "const.hpp"
#include "ledger/ledger_error.hpp"

namespace rc::ledger {
  using common::span::cbytes;

  namespace {
    Bytes encodeBalance(TokenAmount amount) {
      Bytes out;
      common::putUint64BigEndian(out, amount);
      return out;
    }
  }  // namespace

  bool isCustodian(const Identity &account) {
    return boost::algorithm::starts_with(account, kCustodianPrefix);
  }

  LedgerImpl::LedgerImpl(MapPtr storage)
      : storage_{storage},
        balances_{"balance/", storage},
        logger_{common::createLogger("ledger")} {}

  outcome::result<TokenAmount> LedgerImpl::loadBalance(
      const Identity &account) const {
    const auto key{copy(cbytes(account))};
    OUTCOME_TRY(raw, balances_.tryGet(key));
    if (!raw) {
      return TokenAmount{0};
    }
    if (raw->size() != sizeof(TokenAmount)) {
      return LedgerError::kCorruptedBalance;
    }
    return common::decodeBE(*raw);
  }

  outcome::result<TokenAmount> LedgerImpl::balance(
      const Identity &account) const {
    std::lock_guard lock{mutex_};
    return loadBalance(account);
  }

  outcome::result<void> LedgerImpl::credit(const Identity &account,
                                           TokenAmount amount) {
    if (amount == 0) {
      return LedgerError::kInvalidAmount;
    }
    std::lock_guard lock{mutex_};
    OUTCOME_TRY(current, loadBalance(account));
    if (current > std::numeric_limits<TokenAmount>::max() - amount) {
      return LedgerError::kOverflow;
    }
    OUTCOME_TRY(balances_.put(copy(cbytes(account)),
                              encodeBalance(current + amount)));
    logger_->info("credit {} to {}", amount, account);
    return outcome::success();
  }

  outcome::result<void> LedgerImpl::transfer(const Transfer &transfer) {
    if (isCustodian(transfer.from)) {
      return LedgerError::kCustodianLocked;
    }
    std::lock_guard lock{mutex_};
    auto batch{storage_->batch()};
    OUTCOME_TRY(stageLocked(*batch, {transfer}));
    OUTCOME_TRY(batch->commit());
    logger_->info(
        "transfer {} from {} to {}", transfer.amount, transfer.from, transfer.to);
    return outcome::success();
  }

  outcome::result<void> LedgerImpl::commit(
      BufferBatch &batch, const std::vector<Transfer> &transfers) {
    std::lock_guard lock{mutex_};
    OUTCOME_TRY(stageLocked(batch, transfers));
    return batch.commit();
  }

  outcome::result<TokenAmount> LedgerImpl::cached(
      Balances &balances, const Identity &account) const {
    auto it{balances.find(account)};
    if (it == balances.end()) {
      OUTCOME_TRY(loaded, loadBalance(account));
      it = balances.emplace(account, loaded).first;
    }
    return it->second;
  }

  outcome::result<void> LedgerImpl::stageLocked(
      BufferBatch &batch, const std::vector<Transfer> &transfers) {
    Balances balances;
    for (const auto &transfer : transfers) {
      if (transfer.amount == 0) {
        return LedgerError::kInvalidAmount;
      }
      OUTCOME_TRY(from, cached(balances, transfer.from));
      if (from < transfer.amount) {
        logger_->debug("{} has {}, cannot pay {}",
                       transfer.from,
                       from,
                       transfer.amount);
        return LedgerError::kInsufficientFunds;
      }
      balances[transfer.from] = from - transfer.amount;
      OUTCOME_TRY(to, cached(balances, transfer.to));
      if (to > std::numeric_limits<TokenAmount>::max() - transfer.amount) {
        return LedgerError::kOverflow;
      }
      balances[transfer.to] = to + transfer.amount;
    }
    for (const auto &[account, amount] : balances) {
      OUTCOME_TRY(batch.put(balances_._key(account), encodeBalance(amount)));
    }
    return outcome::success();
  }
}  // namespace rc::ledger
