/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/filesystem/operations.hpp>
#include <csignal>
#include <cstdio>
#include <iostream>

#include "cli/vegam/progress.hpp"
#include "cli/vegam/vegam.hpp"
#include "ticket/ticket_error.hpp"

namespace vegam::cli::_vegam {
  /// Asks user, "y" or "yes" confirms
  inline bool confirm(const std::string &question) {
    fmt::print("{} [y/N] ", question);
    std::fflush(stdout);
    std::string answer;
    if (!std::getline(std::cin, answer)) {
      return false;
    }
    answer = boost::algorithm::to_lower_copy(
        boost::algorithm::trim_copy(answer));
    return answer == "y" || answer == "yes";
  }

  struct Vegam_receive {
    struct Args {
      CLI_BOOL("yes,y", "do not ask for confirmation") yes;

      CLI_OPTS() {
        Opts opts;
        yes(opts);
        return opts;
      }
    };

    CLI_RUN() {
      const auto &ticket{cliArgv(argv, 0, "ticket")};
      Vegam::Engine engine{argm};

      // approval gate
      std::string file_name{engine.config.placeholder_name};
      auto metadata{engine.orchestrator->inspect(ticket)};
      if (metadata) {
        file_name = metadata.value().file_name;
        if (!args.yes
            && !confirm(fmt::format(
                "Receive '{}' ({})?",
                file_name,
                common::formatFileSize(metadata.value().file_size)))) {
          throw CliError{"receive declined"};
        }
      } else if (metadata.error()
                 == ticket::TicketError::kMetadataUnavailable) {
        if (!args.yes
            && !confirm("Receive file of unknown name and size?")) {
          throw CliError{"receive declined"};
        }
      } else {
        cliTry(std::move(metadata), "inspect ticket");
      }

      std::string output;
      if (argv.size() > 1) {
        output = argv[1];
      } else {
        output = (boost::filesystem::path{engine.config.download_dir}
                  / boost::filesystem::path{file_name}.filename())
                     .string();
      }

      const auto id{cliTry(engine.orchestrator->receive(ticket, output),
                           "receive into {}",
                           output)};
      auto waiter{TransferWaiter::make(
          *engine.events, *engine.orchestrator, id)};
      boost::asio::signal_set signals{*engine.thread.io, SIGINT, SIGTERM};
      signals.async_wait([orchestrator{engine.orchestrator}, id, waiter](
                             auto ec, auto) {
        if (!ec) {
          if (auto res{orchestrator->cancel(id)}; !res) {
            fmt::print(stderr, "cancel: {}\n", res.error().message());
          }
          waiter->interrupt();
        }
      });

      const auto record{waiter->wait()};
      if (record.status != transfer::TransferStatus::kCompleted) {
        throw CliError{"receive {}: {}",
                       *common::to_string(record.status),
                       record.error.value_or("interrupted")};
      }
      fmt::print("saved {} ({})\n",
                 output,
                 common::formatFileSize(record.bytes_transferred));
    }
  };
}  // namespace vegam::cli::_vegam
