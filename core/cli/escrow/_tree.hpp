/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/escrow/commands.hpp"
#include "cli/tree.hpp"

#define CMD(NAME, TYPE) \
  { NAME, tree<TYPE>() }

namespace rc::cli::cli_escrow {
  const auto _tree{tree<Escrow>({
      CMD("fund", Escrow_fund),
      CMD("balance", Escrow_balance),
      CMD("create", Escrow_create),
      CMD("offer", Escrow_offer),
      CMD("confirm", Escrow_confirm),
      CMD("cancel", Escrow_cancel),
      CMD("show", Escrow_show),
      CMD("list", Escrow_list),
  })};
}  // namespace rc::cli::cli_escrow

#undef CMD
