/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/state_store.hpp"

#include "common/endian.hpp"
#include "escrow/escrow_error.hpp"

namespace rc::escrow {
  using common::span::bytestr;
  using common::span::cbytes;

  namespace {
    std::string dealPrefix(DealId deal_id) {
      return "deal/" + std::to_string(deal_id) + "/";
    }

    Bytes keyBytes(std::string_view key) {
      return copy(cbytes(key));
    }
  }  // namespace

  StateStore::StateStore(MapPtr storage, DealId deal_id)
      : deal_id_{deal_id}, map_{dealPrefix(deal_id), std::move(storage)} {}

  DealId StateStore::dealId() const {
    return deal_id_;
  }

  Bytes StateStore::encodeValue(const Value &value) {
    Bytes out;
    if (const auto *number = boost::get<uint64_t>(&value)) {
      out.push_back(static_cast<uint8_t>(Tag::kUint));
      common::putUint64BigEndian(out, *number);
    } else {
      const auto &bytes{boost::get<Bytes>(value)};
      out.reserve(bytes.size() + 1);
      out.push_back(static_cast<uint8_t>(Tag::kBytes));
      append(out, bytes);
    }
    return out;
  }

  outcome::result<Value> StateStore::decodeValue(BytesIn bytes) {
    if (bytes.empty()) {
      return EscrowError::kStateCorrupted;
    }
    const auto payload{bytes.subspan(1)};
    switch (static_cast<Tag>(bytes[0])) {
      case Tag::kUint:
        if (payload.size() != sizeof(uint64_t)) {
          return EscrowError::kStateCorrupted;
        }
        return Value{common::decodeBE(payload)};
      case Tag::kBytes:
        return Value{copy(payload)};
    }
    return EscrowError::kStateCorrupted;
  }

  outcome::result<Value> StateStore::get(std::string_view key) const {
    OUTCOME_TRY(raw, map_.tryGet(keyBytes(key)));
    if (!raw) {
      return EscrowError::kNotFound;
    }
    return decodeValue(*raw);
  }

  outcome::result<void> StateStore::put(std::string_view key,
                                        const Value &value) {
    return map_.put(keyBytes(key), encodeValue(value));
  }

  outcome::result<bool> StateStore::exists(std::string_view key) const {
    return map_.contains(keyBytes(key));
  }

  outcome::result<uint64_t> StateStore::getUint(std::string_view key) const {
    OUTCOME_TRY(value, get(key));
    if (const auto *number = boost::get<uint64_t>(&value)) {
      return *number;
    }
    return EscrowError::kStateCorrupted;
  }

  outcome::result<Bytes> StateStore::getBytes(std::string_view key) const {
    OUTCOME_TRY(value, get(key));
    if (auto *bytes = boost::get<Bytes>(&value)) {
      return std::move(*bytes);
    }
    return EscrowError::kStateCorrupted;
  }

  outcome::result<Deal> StateStore::load() const {
    OUTCOME_TRY(listed, exists(keys::kStatus));
    if (!listed) {
      return EscrowError::kNotFound;
    }
    // every other field is written together with status
    auto required{[](auto result) -> decltype(result) {
      if (!result && result.error() == EscrowError::kNotFound) {
        return EscrowError::kStateCorrupted;
      }
      return result;
    }};

    Deal deal;
    deal.id = deal_id_;
    OUTCOME_TRY(status, required(getUint(keys::kStatus)));
    if (status > static_cast<uint64_t>(DealStatus::kCancelled)) {
      return EscrowError::kStateCorrupted;
    }
    deal.status = static_cast<DealStatus>(status);
    OUTCOME_TRY(seller, required(getBytes(keys::kSeller)));
    deal.seller = std::string{bytestr(seller)};
    OUTCOME_TRY(has_buyer, exists(keys::kBuyer));
    if (has_buyer) {
      OUTCOME_TRY(buyer, getBytes(keys::kBuyer));
      deal.buyer = std::string{bytestr(buyer)};
    }
    OUTCOME_TRY(price, required(getUint(keys::kPrice)));
    deal.price = price;
    OUTCOME_TRY(reserve, required(getUint(keys::kReserve)));
    deal.reserve = reserve;
    OUTCOME_TRY(property_hash, required(getBytes(keys::kPropertyHash)));
    deal.property_hash = std::move(property_hash);
    OUTCOME_TRY(created, required(getUint(keys::kCreated)));
    deal.created_at = UnixTime{static_cast<int64_t>(created)};
    OUTCOME_TRY(deadline, required(getUint(keys::kDeadline)));
    deal.deadline = UnixTime{static_cast<int64_t>(deadline)};
    return std::move(deal);
  }

  outcome::result<void> StateStore::stage(BufferBatch &batch,
                                          const Deal &deal) const {
    auto put{[&](std::string_view key, const Value &value) {
      return batch.put(map_._key(key), encodeValue(value));
    }};
    OUTCOME_TRY(put(keys::kSeller, copy(cbytes(deal.seller))));
    if (deal.buyer) {
      OUTCOME_TRY(put(keys::kBuyer, copy(cbytes(*deal.buyer))));
    } else {
      OUTCOME_TRY(batch.remove(map_._key(keys::kBuyer)));
    }
    OUTCOME_TRY(put(keys::kPrice, deal.price));
    OUTCOME_TRY(put(keys::kReserve, deal.reserve));
    OUTCOME_TRY(put(keys::kPropertyHash, deal.property_hash));
    OUTCOME_TRY(
        put(keys::kCreated, static_cast<uint64_t>(deal.created_at.count())));
    OUTCOME_TRY(
        put(keys::kDeadline, static_cast<uint64_t>(deal.deadline.count())));
    OUTCOME_TRY(put(keys::kStatus, static_cast<uint64_t>(deal.status)));
    return outcome::success();
  }
}  // namespace rc::escrow
