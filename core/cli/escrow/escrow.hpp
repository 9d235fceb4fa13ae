/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "cli/cli.hpp"
#include "cli/validate/with.hpp"
#include "clock/impl/utc_clock_impl.hpp"
#include "common/hexutil.hpp"
#include "config/profile_config.hpp"
#include "escrow/escrow_facade.hpp"
#include "ledger/impl/ledger_impl.hpp"
#include "storage/leveldb/leveldb.hpp"

namespace rc::cli::cli_escrow {
  using escrow::Deal;
  using escrow::DealId;
  using escrow::EscrowFacade;
  using primitives::Identity;
  using primitives::TokenAmount;

  struct LogLevel {
    spdlog::level::level_enum level;
  };

  CLI_VALIDATE(LogLevel) {
    validateWith(out, values, [](const std::string &value) {
      const auto level{spdlog::level::from_str(value)};
      if (level == spdlog::level::off && value != "off") {
        throw std::exception{};
      }
      return LogLevel{level};
    });
  }

  struct Escrow {
    struct Args {
      std::string repo;
      boost::optional<std::string> now;

      CLI_OPTS() {
        Opts opts;
        auto opt{opts.add_options()};
        opt("repo",
            po::value(&repo)->default_value(".realchain"),
            "LevelDB directory with deals and balances");
        opt("now",
            po::value(&now),
            "Time of action, unix seconds or YYYY-MM-DDTHH:MM:SSZ, "
            "current time if omitted");
        opt("log-level",
            po::value<LogLevel>()
                ->default_value({spdlog::level::warn}, "warning")
                ->notifier([](const LogLevel &log_level) {
                  common::setLogLevel(log_level.level);
                }),
            "trace, debug, info, warning, error, critical or off");
        opts.add(config::configProfile());
        return opts;
      }
    };
    CLI_RUN() {
      throw ShowHelp{};
    }

    /** Opened repository and escrow on top of it */
    struct Repo {
      std::shared_ptr<storage::LevelDB> db;
      std::shared_ptr<ledger::Ledger> ledger;
      std::shared_ptr<EscrowFacade> escrow;
      clock::UnixTime now;

      explicit Repo(ArgsMap &argm) {
        const auto &args{argm.of<Escrow>()};
        const auto logger{common::createLogger("cli")};
        db = cliTry(storage::LevelDB::create(args.repo),
                    "open repository {}",
                    args.repo);
        ledger = std::make_shared<ledger::LedgerImpl>(db);
        escrow = std::make_shared<EscrowFacade>(db, ledger);
        if (args.now) {
          now = cliTry(clock::unixTimeFromString(*args.now),
                       "parse --now {}",
                       *args.now);
        } else {
          now = clock::UTCClockImpl{}.nowUTC();
        }
        logger->debug(
            "repository {} at {}", args.repo, clock::unixTimeToString(now));
      }

      EscrowFacade *operator->() const {
        return escrow.get();
      }

      Deal deal(DealId deal_id) const {
        return cliTry(escrow->readState(deal_id), "read deal {}", deal_id);
      }
    };
  };

  inline Bytes parseHash(const std::string &hex) {
    return cliTry(common::unhex(hex), "parse property hash {}", hex);
  }

  inline void printDeal(const Deal &deal) {
    fmt::print("deal {}\n", deal.id);
    fmt::print("  status:        {}\n", escrow::dealStatusName(deal.status));
    fmt::print("  seller:        {}\n", deal.seller);
    fmt::print("  buyer:         {}\n", deal.buyer.value_or("-"));
    fmt::print("  price:         {}\n", deal.price);
    fmt::print("  reserve:       {}\n", deal.reserve);
    fmt::print("  property hash: {}\n", common::hex_lower(deal.property_hash));
    fmt::print("  created:       {}\n",
               clock::unixTimeToString(deal.created_at));
    fmt::print("  deadline:      {}\n", clock::unixTimeToString(deal.deadline));
    fmt::print("  custodian:     {}\n", escrow::custodianOf(deal.id));
  }
}  // namespace rc::cli::cli_escrow
