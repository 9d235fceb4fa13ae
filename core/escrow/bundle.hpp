/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/variant.hpp>
#include <string>
#include <vector>

#include "escrow/deal.hpp"

namespace rc::escrow {
  namespace method {
    constexpr std::string_view kCreateListing{"create_listing"};
    constexpr std::string_view kMakeOffer{"make_offer"};
    constexpr std::string_view kConfirmTransfer{"confirm_transfer"};
    constexpr std::string_view kCancelDeal{"cancel_deal"};
    constexpr std::string_view kReadState{"read_state"};
  }  // namespace method

  /** Fund transfer declared in a bundle */
  struct Payment {
    Identity sender;
    Identity receiver;
    TokenAmount amount{};

    bool operator==(const Payment &other) const {
      return sender == other.sender && receiver == other.receiver
             && amount == other.amount;
    }
  };

  /** State transition call of the escrow */
  struct AppCall {
    Identity sender;
    DealId deal_id{};
    std::string method;
    std::vector<Bytes> args;
  };

  using Transaction = boost::variant<Payment, AppCall>;

  /**
   * Transactions applied together or not at all. Signatures are checked by
   * the signer before the bundle reaches escrow.
   */
  using Bundle = std::vector<Transaction>;
}  // namespace rc::escrow
