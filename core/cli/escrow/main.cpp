/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cli/escrow/_tree.hpp"
#include "cli/run.hpp"

int main(int argc, const char *argv[]) {
  return rc::cli::run(
      "realchain-escrow", rc::cli::cli_escrow::_tree, argc, argv);
}
