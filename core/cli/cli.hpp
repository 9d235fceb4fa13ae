/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <boost/program_options/options_description.hpp>
#include <map>
#include <memory>
#include <typeindex>

#include "cli/try.hpp"

/**
 * Option which may be omitted, accessing missing value throws CliError
 */
#define CLI_OPTIONAL(NAME, DESCRIPTION, TYPE)                              \
  struct {                                                                 \
    boost::optional<TYPE> v;                                               \
    void operator()(Opts &opts) {                                          \
      opts.add_options()(NAME, po::value(&v), DESCRIPTION);                \
    }                                                                      \
    operator bool() const {                                                \
      return v.operator bool();                                            \
    }                                                                      \
    void check() const {                                                   \
      if (!v) {                                                            \
        throw ::rc::cli::CliError{"--{} argument is required but missing", \
                                  NAME};                                   \
      }                                                                    \
    }                                                                      \
    auto &operator*() const {                                              \
      check();                                                             \
      return *v;                                                           \
    }                                                                      \
    auto *operator->() const {                                             \
      return &**this;                                                      \
    }                                                                      \
  }

#define CLI_OPTS() ::rc::cli::Opts opts()
#define CLI_RUN()                  \
  static ::rc::cli::RunResult run( \
      ::rc::cli::ArgsMap &argm, Args &args, ::rc::cli::Argv &&argv)
#define CLI_NO_RUN() constexpr static std::nullptr_t run{nullptr};

namespace rc::cli {
  namespace po = boost::program_options;
  using Opts = po::options_description;

  using RunResult = void;

  /** Parsed arguments of every command on the path to current one */
  struct ArgsMap {
    std::map<std::type_index, std::shared_ptr<void>> _;
    template <typename Cmd>
    typename Cmd::Args &of() {
      return *reinterpret_cast<typename Cmd::Args *>(
          _.at(typeid(typename Cmd::Args)).get());
    }
  };
  // note: Args is defined inside command
  using Argv = std::vector<std::string>;

  struct Empty {
    struct Args {
      CLI_OPTS() {
        return {};
      }
    };
    CLI_NO_RUN();
  };

  struct ShowHelp {};
}  // namespace rc::cli
