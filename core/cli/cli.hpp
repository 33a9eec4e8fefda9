/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include "common/outcome.hpp"

#define CLI_OPTS() ::ps::cli::Opts opts()
#define CLI_RUN() static void run(Args &args, ::ps::cli::Argv &&argv)

namespace ps::cli {
  namespace po = boost::program_options;
  using Opts = po::options_description;
  using Argv = std::vector<std::string>;

  enum ExitCode : int { kExitOk = 0, kExitError = 1, kExitUsage = 2 };

  /// Command failure printed to stderr
  struct CliError : std::runtime_error {
    template <typename... Args>
    explicit CliError(std::string_view format, const Args &...args)
        : runtime_error{fmt::format(fmt::runtime(format), args...)} {}
  };

  /// Thrown by a command to print its usage
  struct ShowHelp {};

  /**
   * Unwrap result or throw CliError with context and error message
   * @param result - operation result
   * @param format - context of the operation
   */
  template <typename R, typename... Args>
  auto cliTry(outcome::result<R> &&result,
              std::string_view format,
              const Args &...args) {
    if (!result) {
      throw CliError{"{}: {}",
                     fmt::format(fmt::runtime(format), args...),
                     result.error().message()};
    }
    return std::move(result).value();
  }

  inline const std::string &cliArgv(const Argv &argv,
                                    size_t i,
                                    std::string_view name) {
    if (i >= argv.size()) {
      throw CliError{"positional argument <{}> is missing", name};
    }
    return argv[i];
  }

  /// Positional argument parsed with program_options validators
  template <typename T>
  T cliArgv(const Argv &argv, size_t i, std::string_view name) {
    const auto &arg{cliArgv(argv, i, name)};
    boost::any out;
    po::typed_value<T> semantic{nullptr};
    try {
      semantic.xparse(out, Argv{arg});
    } catch (const po::validation_error &) {
      throw CliError{"invalid <{}>: '{}'", name, arg};
    }
    return boost::any_cast<T>(out);
  }

  /// Command without options and action, only groups subcommands
  struct Group {
    struct Args {
      CLI_OPTS() {
        return {};
      }
    };
    CLI_RUN() {
      throw ShowHelp{};
    }
  };
}  // namespace ps::cli
