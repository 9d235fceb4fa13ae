/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cstdlib>
#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include "cli/tree.hpp"

namespace rc::cli {
  inline bool isDash(const std::string &s) {
    return !s.empty() && s[0] == '-';
  }
  inline bool isDashDash(const std::string &s) {
    return s.size() == 2 && s[0] == '-' && s[1] == '-';
  }

  /**
   * Parses options of one command level, stops at first positional argument
   * which may name subcommand
   * @return first positional arg or end
   */
  inline Argv::iterator parseLevel(po::variables_map &vm,
                                   const Opts &opts,
                                   Argv::iterator begin,
                                   Argv::iterator end) {
    po::parsed_options parsed{&opts};
    while (begin != end && isDash(*begin)) {
      if (isDashDash(*begin)) {
        ++begin;
        break;
      }
      const auto it{std::find_if(begin + 1, end, isDash)};
      const auto options{
          po::command_line_parser{Argv{begin, it}}.options(opts).run().options};
      if (options.empty()) {
        break;
      }
      for (const auto &option : options) {
        parsed.options.emplace_back(option);
        if (option.string_key.empty()) {
          break;
        }
        begin += option.original_tokens.size();
      }
    }
    po::store(parsed, vm);
    return begin;
  }

  /**
   * Walks command tree along argv and runs the last command
   * @return process exit code
   */
  inline int run(std::string app, const Tree &root, Argv argv) {
    auto tree{&root};
    std::vector<std::string> cmds;
    cmds.emplace_back(std::move(app));
    ArgsMap argm;
    auto argv_it{argv.begin()};
    while (true) {
      auto args{tree->args()};
      args.opts.add_options()("help,h", "print help");
      po::variables_map vm;
      try {
        argv_it = parseLevel(vm, args.opts, argv_it, argv.end());
        if (vm.count("help") == 0) {
          po::notify(vm);
        }
      } catch (po::error &e) {
        fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
        return EXIT_FAILURE;
      }
      if (vm.count("help") == 0) {
        argm._.emplace(args._);
        if (argv_it != argv.end()) {
          auto sub_it{tree->sub.find(*argv_it)};
          if (sub_it != tree->sub.end()) {
            ++argv_it;
            cmds.emplace_back(sub_it->first);
            tree = &sub_it->second;
            continue;
          }
          fmt::print(
              stderr, "{}: unknown command {}\n", fmt::join(cmds, " "), *argv_it);
          return EXIT_FAILURE;
        }
        if (tree->run) {
          try {
            tree->run(argm, {argv_it, argv.end()});
            return EXIT_SUCCESS;
          } catch (ShowHelp &) {
          } catch (po::error &e) {
            fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
            return EXIT_FAILURE;
          } catch (CliError &e) {
            fmt::print(stderr, "{}: {}\n", fmt::join(cmds, " "), e.what());
            return EXIT_FAILURE;
          }
        }
      }
      fmt::print("name:\n  {}\n", fmt::join(cmds, " "));
      fmt::print("options:\n{}", fmt::streamed(args.opts));
      if (!tree->sub.empty()) {
        fmt::print("subcommands:\n");
        for (const auto &sub : tree->sub) {
          fmt::print("  {}\n", sub.first);
        }
      }
      return EXIT_SUCCESS;
    }
  }

  inline int run(std::string app,
                 const Tree &tree,
                 int argc,
                 const char *argv[]) {
    return run(std::move(app), tree, {argv + 1, argv + argc});
  }
}  // namespace rc::cli
