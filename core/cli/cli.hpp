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

/// Switch option, e.g. CLI_BOOL("yes,y", "...") yes;
#define CLI_BOOL(NAME, DESCRIPTION)                               \
  struct {                                                        \
    bool v{};                                                     \
    void operator()(Opts &opts) {                                 \
      opts.add_options()(NAME, po::bool_switch(&v), DESCRIPTION); \
    }                                                             \
    operator bool() const {                                       \
      return v;                                                   \
    }                                                             \
  }

#define CLI_OPTS() ::vegam::cli::Opts opts()
#define CLI_RUN()                     \
  static ::vegam::cli::RunResult run( \
      ::vegam::cli::ArgsMap &argm, Args &args, ::vegam::cli::Argv &&argv)
#define CLI_NO_RUN() constexpr static std::nullptr_t run{nullptr};

namespace vegam::cli {
  namespace po = boost::program_options;
  using Opts = po::options_description;

  using RunResult = void;

  /// Parsed options of every command on the path, keyed by Args type
  struct ArgsMap {
    std::map<std::type_index, std::shared_ptr<void>> _;

    template <typename Cmd>
    typename Cmd::Args &of() const {
      return *reinterpret_cast<typename Cmd::Args *>(
          _.at(typeid(typename Cmd::Args)).get());
    }
  };
  // note: Args is defined inside command
  using Argv = std::vector<std::string>;

  inline const std::string &cliArgv(const Argv &argv,
                                    size_t i,
                                    const std::string_view &name) {
    if (i < argv.size()) {
      return argv[i];
    }
    throw CliError{"positional argument {} is required but missing", name};
  }

  /// Command without options and action, only groups subcommands
  struct Group {
    struct Args {
      CLI_OPTS() {
        return {};
      }
    };
    CLI_NO_RUN();
  };

  /// Thrown by command to print its help
  struct ShowHelp {};
}  // namespace vegam::cli
