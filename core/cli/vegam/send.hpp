/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/signal_set.hpp>
#include <csignal>

#include "cli/vegam/progress.hpp"
#include "cli/vegam/vegam.hpp"

namespace vegam::cli::_vegam {
  struct Vegam_send {
    struct Args {
      CLI_BOOL("seal", "wrap ticket into sealed envelope") seal;
      CLI_BOOL("once", "stop after the first complete delivery") once;

      CLI_OPTS() {
        Opts opts;
        seal(opts);
        once(opts);
        return opts;
      }
    };

    CLI_RUN() {
      const auto &path{cliArgv(argv, 0, "path")};
      const bool seal{args.seal};
      Vegam::Engine engine{argm, [seal](EngineConfig &config) {
                             config.seal_tickets = config.seal_tickets || seal;
                           }};
      const auto sent{
          cliTry(engine.orchestrator->send(path), "send {}", path)};

      fmt::print("file: {} ({})\n",
                 sent.file_name,
                 common::formatFileSize(sent.file_size));
      fmt::print("ticket:\n{}\n", sent.ticket);

      auto waiter{TransferWaiter::make(
          *engine.events, *engine.orchestrator, sent.id)};
      boost::asio::signal_set signals{*engine.thread.io, SIGINT, SIGTERM};
      if (args.once) {
        signals.async_wait([waiter](auto ec, auto) {
          if (!ec) {
            waiter->interrupt();
          }
        });
        const auto record{waiter->wait()};
        if (auto res{engine.orchestrator->withdraw(sent.id)}; !res) {
          engine.logger->debug(
              "withdraw {}: {}", sent.id, res.error().message());
        }
        if (record.status != transfer::TransferStatus::kCompleted) {
          throw CliError{"send {}: {}",
                         *common::to_string(record.status),
                         record.error.value_or("interrupted")};
        }
        return;
      }

      fmt::print("serving, press Ctrl+C to stop\n");
      auto interrupted{std::make_shared<std::promise<void>>()};
      auto future{interrupted->get_future()};
      signals.async_wait([interrupted](auto ec, auto) {
        if (!ec) {
          interrupted->set_value();
        }
      });
      future.wait();
    }
  };
}  // namespace vegam::cli::_vegam
