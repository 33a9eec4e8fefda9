/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <memory>

#include <fmt/ranges.h>

#include "cli/cli.hpp"

namespace ps::cli {
  /// Options of one command bound to a fresh Args instance
  struct Invocation {
    Opts opts;
    std::function<void(Argv &&)> run;
  };

  struct Command {
    using Sub = std::map<std::string, Command>;

    std::string description;
    std::function<Invocation()> invoke;
    Sub sub;
  };

  template <typename Cmd>
  Command command(std::string description, Command::Sub sub = {}) {
    Command cmd;
    cmd.description = std::move(description);
    cmd.invoke = [] {
      auto args{std::make_shared<typename Cmd::Args>()};
      auto opts{args->opts()};
      return Invocation{std::move(opts), [args](Argv &&argv) {
                          Cmd::run(*args, std::move(argv));
                        }};
    };
    cmd.sub = std::move(sub);
    return cmd;
  }

  inline void printHelp(const std::vector<std::string> &path,
                        const Command &cmd,
                        const Opts &opts) {
    fmt::print("usage:\n  {}", fmt::join(path, " "));
    if (!cmd.sub.empty()) {
      fmt::print(" <command>");
    }
    fmt::print("\n");
    if (!cmd.description.empty()) {
      fmt::print("\n{}\n", cmd.description);
    }
    std::cout << "\n" << opts;
    if (!cmd.sub.empty()) {
      fmt::print("\ncommands:\n");
      for (const auto &[name, sub] : cmd.sub) {
        fmt::print("  {:<12}{}\n", name, sub.description);
      }
    }
    std::cout.flush();
  }

  /**
   * Descend command tree by argv and run the last matched command.
   * Options of each command precede the name of its subcommand.
   * @return process exit code
   */
  inline int run(const std::string &app, const Command &root, Argv argv) {
    std::vector<std::string> path{app};
    const Command *cmd{&root};
    auto it{argv.begin()};
    while (true) {
      auto invocation{cmd->invoke()};
      invocation.opts.add_options()("help,h", "print help");
      const auto next{
          std::find_if(it, argv.end(), [&](const std::string &token) {
            return cmd->sub.count(token) != 0;
          })};

      Argv positional;
      po::variables_map vm;
      try {
        Opts hidden;
        hidden.add_options()("positional", po::value(&positional));
        Opts all;
        all.add(invocation.opts).add(hidden);
        po::positional_options_description order;
        order.add("positional", -1);
        po::store(po::command_line_parser{Argv{it, next}}
                      .options(all)
                      .positional(order)
                      .run(),
                  vm);
        if (vm.count("help") != 0) {
          printHelp(path, *cmd, invocation.opts);
          return kExitOk;
        }
        po::notify(vm);
      } catch (const po::error &e) {
        fmt::print(stderr, "{}: {}\n", fmt::join(path, " "), e.what());
        return kExitUsage;
      }

      if (next != argv.end()) {
        if (!positional.empty()) {
          fmt::print(stderr,
                     "{}: unexpected argument '{}'\n",
                     fmt::join(path, " "),
                     positional.front());
          return kExitUsage;
        }
        path.push_back(*next);
        cmd = &cmd->sub.at(*next);
        it = next + 1;
        continue;
      }

      try {
        invocation.run(std::move(positional));
        return kExitOk;
      } catch (const ShowHelp &) {
        printHelp(path, *cmd, invocation.opts);
        return kExitUsage;
      } catch (const CliError &e) {
        fmt::print(stderr, "{}: {}\n", fmt::join(path, " "), e.what());
        return kExitError;
      }
    }
  }

  inline int run(const std::string &app,
                 const Command &root,
                 int argc,
                 const char *argv[]) {
    return run(app, root, Argv{argv + 1, argv + argc});
  }
}  // namespace ps::cli
