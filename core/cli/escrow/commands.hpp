/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/escrow/escrow.hpp"
#include "escrow/bundle_builder.hpp"

namespace rc::cli::cli_escrow {

  struct Escrow_fund {
    struct Args {
      CLI_OPTIONAL("account", "account to credit", Identity) account;
      CLI_OPTIONAL("amount", "amount in micro-units", TokenAmount) amount;

      CLI_OPTS() {
        Opts opts;
        account(opts);
        amount(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const Escrow::Repo repo{argm};
      cliTry(repo.ledger->credit(*args.account, *args.amount),
             "credit {}",
             *args.account);
      fmt::print("{}: {}\n",
                 *args.account,
                 cliTry(repo.ledger->balance(*args.account), "balance"));
    }
  };

  struct Escrow_balance {
    struct Args {
      CLI_OPTIONAL("account", "account to query", Identity) account;

      CLI_OPTS() {
        Opts opts;
        account(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const Escrow::Repo repo{argm};
      fmt::print("{}\n",
                 cliTry(repo.ledger->balance(*args.account),
                        "balance of {}",
                        *args.account));
    }
  };

  struct Escrow_create {
    struct Args {
      CLI_OPTIONAL("seller", "seller account", Identity) seller;
      CLI_OPTIONAL("price", "price in micro-units", TokenAmount) price;
      CLI_OPTIONAL("hash", "property documents hash, hex", std::string) hash;

      CLI_OPTS() {
        Opts opts;
        seller(opts);
        price(opts);
        hash(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const Escrow::Repo repo{argm};
      const auto deal{cliTry(
          repo->createListing(
              *args.seller, *args.price, parseHash(*args.hash), repo.now),
          "create listing")};
      printDeal(deal);
    }
  };

  struct Escrow_offer {
    struct Args {
      CLI_OPTIONAL("deal", "deal id", DealId) deal;
      CLI_OPTIONAL("buyer", "buyer account, pays full price", Identity) buyer;

      CLI_OPTS() {
        Opts opts;
        deal(opts);
        buyer(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const Escrow::Repo repo{argm};
      const auto deal{repo.deal(*args.deal)};
      printDeal(cliTry(repo->makeOffer(deal.id,
                                       *args.buyer,
                                       escrow::offerBundle(deal, *args.buyer),
                                       repo.now),
                       "make offer on deal {}",
                       deal.id));
    }
  };

  struct Escrow_confirm {
    struct Args {
      CLI_OPTIONAL("deal", "deal id", DealId) deal;
      CLI_OPTIONAL("seller", "seller account", Identity) seller;
      CLI_OPTIONAL("hash", "expected property hash, hex", std::string) hash;

      CLI_OPTS() {
        Opts opts;
        deal(opts);
        seller(opts);
        hash(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const Escrow::Repo repo{argm};
      const auto deal{repo.deal(*args.deal)};
      const auto bundle{cliTry(
          escrow::payoutBundle(
              deal, *args.seller, args.hash ? parseHash(*args.hash) : Bytes{}),
          "build payout bundle")};
      printDeal(cliTry(
          repo->confirmTransfer(deal.id, *args.seller, bundle, repo.now),
          "confirm transfer of deal {}",
          deal.id));
    }
  };

  struct Escrow_cancel {
    struct Args {
      CLI_OPTIONAL("deal", "deal id", DealId) deal;
      CLI_OPTIONAL("caller", "seller, buyer or anyone after deadline", Identity)
      caller;

      CLI_OPTS() {
        Opts opts;
        deal(opts);
        caller(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const Escrow::Repo repo{argm};
      const auto deal{repo.deal(*args.deal)};
      const auto bundle{cliTry(escrow::cancelBundle(deal, *args.caller),
                               "build cancel bundle")};
      printDeal(
          cliTry(repo->cancelDeal(deal.id, *args.caller, bundle, repo.now),
                 "cancel deal {}",
                 deal.id));
    }
  };

  struct Escrow_show {
    struct Args {
      CLI_OPTIONAL("deal", "deal id", DealId) deal;

      CLI_OPTS() {
        Opts opts;
        deal(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const Escrow::Repo repo{argm};
      printDeal(repo.deal(*args.deal));
    }
  };

  struct Escrow_list : Empty {
    CLI_RUN() {
      const Escrow::Repo repo{argm};
      for (const auto deal_id : cliTry(repo->deals(), "list deals")) {
        const auto deal{repo.deal(deal_id)};
        fmt::print("{:>6}  {:<10}  {:>14}  {}  {}\n",
                   deal.id,
                   escrow::dealStatusName(deal.status),
                   deal.price,
                   clock::unixTimeToString(deal.deadline),
                   deal.seller);
      }
    }
  };
}  // namespace rc::cli::cli_escrow
