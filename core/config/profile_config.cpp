/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/profile_config.hpp"

#include <boost/lexical_cast.hpp>

#include "cli/validate/with.hpp"
#include "const.hpp"

namespace rc::config {
  /**
   * Class for profile name validation with boost::program_options
   */
  class Profile : public std::string {};

  /** Validated deal window */
  struct DealWindow {
    clock::UnixTime seconds;
  };

  /**
   * Checks that profile name is expected one.
   */
  CLI_VALIDATE(Profile) {
    validateWith(out, values, [](const std::string &value) {
      if (value == "mainnet" || value == "devnet") {
        return Profile{value};
      }
      throw std::exception{};
    });
  }

  CLI_VALIDATE(DealWindow) {
    validateWith(out, values, [](const std::string &value) {
      if (auto seconds{parseDuration(value)}) {
        return DealWindow{*seconds};
      }
      throw std::exception{};
    });
  }

  boost::optional<clock::UnixTime> parseDuration(const std::string &str) {
    if (str.empty()) {
      return boost::none;
    }
    int64_t unit{1};
    auto digits{str};
    switch (str.back()) {
      case 's':
        break;
      case 'm':
        unit = kSecondsInMinute;
        break;
      case 'h':
        unit = kSecondsInHour;
        break;
      case 'd':
        unit = kSecondsInDay;
        break;
      default:
        unit = 0;
    }
    if (unit != 0) {
      digits.pop_back();
    } else {
      unit = 1;
    }
    if (digits.empty() || digits.front() == '-' || digits.front() == '+') {
      return boost::none;
    }
    uint32_t count{};
    if (!boost::conversion::try_lexical_convert(digits, count) || count == 0) {
      return boost::none;
    }
    return clock::UnixTime{count * unit};
  }

  options_description configProfile() {
    struct Overrides {
      boost::optional<clock::UnixTime> deal_window;
      boost::optional<TokenAmount> payout_reserve;

      void apply() const {
        if (deal_window) {
          kDealWindow = *deal_window;
        }
        if (payout_reserve) {
          kPayoutReserve = *payout_reserve;
        }
      }
    };
    // notifiers run in option name order, profile reapplies overrides
    auto overrides{std::make_shared<Overrides>()};

    options_description optionsDescription("Profile options");
    auto option{optionsDescription.add_options()};
    option("profile",
           boost::program_options::value<Profile>()
               ->default_value({"mainnet"}, "mainnet")
               ->notifier([overrides](const auto &profile) {
                 if (profile == "devnet") {
                   setParamsDevnet();
                 } else {
                   setParamsMainnet();
                 }
                 overrides->apply();
               }),
           "Network parameters profile configuration that defines deal "
           "window and payout reserve. Supported profiles: \n"
           " * 'mainnet' (30 days window)\n"
           " * 'devnet' (10 minutes window)\n");
    option("deal-window",
           boost::program_options::value<DealWindow>()->notifier(
               [overrides](const DealWindow &window) {
                 overrides->deal_window = window.seconds;
                 overrides->apply();
               }),
           "Period after listing while offers and confirmation are accepted, "
           "e.g. 3600, 90m, 12h, 30d");
    option("payout-reserve",
           boost::program_options::value<TokenAmount>()->notifier(
               [overrides](TokenAmount reserve) {
                 overrides->payout_reserve = reserve;
                 overrides->apply();
               }),
           "Amount withheld from custodian payouts");

    return optionsDescription;
  }
}  // namespace rc::config
