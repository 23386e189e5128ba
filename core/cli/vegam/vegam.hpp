/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/sinks/basic_file_sink.h>
#include <boost/filesystem/path.hpp>
#include <boost/program_options/errors.hpp>
#include <fstream>

#include "cli/cli.hpp"
#include "clock/impl/steady_clock_impl.hpp"
#include "common/io_thread.hpp"
#include "common/logger.hpp"
#include "config/engine_config.hpp"
#include "config/file_access_option.hpp"
#include "transfer/orchestrator.hpp"
#include "transport/impl/tcp_peer_transport.hpp"

namespace vegam::cli::_vegam {
  using config::EngineConfig;
  using transfer::TransferOrchestrator;

  struct Vegam {
    struct Args {
      boost::optional<boost::filesystem::path> config;
      char log{'i'};
      boost::optional<std::string> log_file;
      boost::optional<uint16_t> listen_port;
      boost::optional<std::string> advertise_host;
      boost::optional<int64_t> throttle_ms;
      boost::optional<platform::FileAccessKind> file_access;

      CLI_OPTS() {
        Opts opts;
        auto opt{opts.add_options()};
        opt("config", po::value(&config), "INI-style config file");
        opt("log,l", po::value(&log), "log level, [e,w,i,d,t]");
        opt("log-file", po::value(&log_file), "also write logs to file");
        opt("listen-port", po::value(&listen_port), "transport port");
        opt("advertise-host",
            po::value(&advertise_host),
            "host written into tickets");
        opt("throttle-ms",
            po::value(&throttle_ms),
            "progress throttle interval, milliseconds");
        opt("file-access",
            po::value(&file_access),
            "file access layer, [local,uri]");
        return opts;
      }
    };
    CLI_RUN() {
      throw ShowHelp{};
    }

    /// Configures logging, loads config file and applies overrides
    static EngineConfig loadConfig(
        const ArgsMap &argm,
        const std::function<void(EngineConfig &)> &adjust) {
      const auto &args{argm.of<Vegam>()};
      spdlog::set_level(common::logLevelFromChar(args.log));
      if (args.log_file) {
        common::file_sink =
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(*args.log_file);
      }

      EngineConfig config;
      if (args.config) {
        std::ifstream file{args.config->string()};
        if (!file.good()) {
          throw CliError{"cannot open config file {}", args.config->string()};
        }
        config = config::readConfig(file);
      }
      if (args.listen_port) {
        config.listen_port = *args.listen_port;
      }
      if (args.advertise_host) {
        config.advertise_host = *args.advertise_host;
      }
      if (args.throttle_ms) {
        if (*args.throttle_ms < 0) {
          throw CliError{"--throttle-ms must not be negative"};
        }
        config.throttle_ms = *args.throttle_ms;
      }
      if (args.file_access) {
        config.file_access = *args.file_access;
      }
      if (config.node_name.empty()) {
        config.node_name = config::defaultNodeName();
      }
      if (adjust) {
        adjust(config);
      }
      return config;
    }

    /// Engine wired with bundled tcp transport
    struct Engine {
      EngineConfig config;
      IoThread thread;
      /// Downloads block their thread, events and serving stay on the other
      IoThread fetch_thread;
      std::shared_ptr<transfer::TransferEvents> events;
      std::shared_ptr<transport::TcpPeerTransport> transport;
      std::shared_ptr<TransferOrchestrator> orchestrator;
      common::Logger logger;

      /// @param adjust - command specific config changes
      explicit Engine(const ArgsMap &argm,
                      const std::function<void(EngineConfig &)> &adjust = {})
          : config{loadConfig(argm, adjust)},
            thread{config.io_threads},
            fetch_thread{config.fetch_threads},
            events{std::make_shared<transfer::TransferEvents>(thread.io)},
            logger{common::createLogger("vegam")} {
        transport::TcpTransportConfig transport_config;
        transport_config.listen_host = config.listen_host;
        transport_config.listen_port = config.listen_port;
        transport_config.advertise_host = config.advertise_host;
        transport_config.connect_timeout = config.connectTimeout();
        transport_config.idle_timeout = config.idleTimeout();
        transport = cliTry(
            transport::TcpPeerTransport::create(
                thread.io,
                std::make_shared<transport::BlobStore>(),
                transport_config),
            "listen on {}:{}",
            config.listen_host,
            config.listen_port);
        transport->start();

        auto registry{std::make_shared<transfer::TransferRegistry>(events)};
        transfer::OrchestratorConfig orchestrator_config;
        orchestrator_config.placeholder_name = config.placeholder_name;
        orchestrator_config.seal_tickets = config.seal_tickets;
        orchestrator = std::make_shared<TransferOrchestrator>(
            fetch_thread.io,
            registry,
            std::make_shared<transfer::ProgressMultiplexer>(
                registry,
                std::make_shared<clock::SteadyClockImpl>(),
                config.throttleInterval()),
            transport,
            platform::makeFileAccess(config.file_access),
            orchestrator_config);
        logger->info("device '{}' ready", config.node_name);
      }

      ~Engine() {
        for (auto &record : orchestrator->list()) {
          if (!transfer::isTerminal(record.status)) {
            if (auto res{orchestrator->cancel(record.id)}; !res) {
              logger->debug("cancel {}: {}", record.id, res.error().message());
            }
          }
        }
        events->stop();
        transport->stop();
      }
    };
  };
}  // namespace vegam::cli::_vegam
