/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/engine_config.hpp"

#include <boost/asio/ip/host_name.hpp>
#include <boost/program_options.hpp>

#include "config/file_access_option.hpp"

namespace vegam::config {
  namespace po = boost::program_options;

  po::options_description configOptions(EngineConfig &config) {
    po::options_description desc("Vegam engine options");
    auto option{desc.add_options()};
    option("throttle-ms",
           po::value(&config.throttle_ms),
           "progress throttle interval, milliseconds");
    option("placeholder-name",
           po::value(&config.placeholder_name),
           "file name for legacy tickets");
    option("listen-host",
           po::value(&config.listen_host),
           "transport bind host");
    option("advertise-host",
           po::value(&config.advertise_host),
           "host written into tickets");
    option("listen-port", po::value(&config.listen_port), "transport port");
    option("download-dir",
           po::value(&config.download_dir),
           "default receive directory");
    option("file-access",
           po::value(&config.file_access),
           "file access layer, [local,uri]");
    option("io-threads", po::value(&config.io_threads), "io threads");
    option("fetch-threads",
           po::value(&config.fetch_threads),
           "threads running downloads");
    option("connect-timeout-ms",
           po::value(&config.connect_timeout_ms),
           "deadline of connecting to a peer, milliseconds");
    option("idle-timeout-ms",
           po::value(&config.idle_timeout_ms),
           "deadline of a stalled download, milliseconds");
    option("seal-tickets",
           po::value(&config.seal_tickets),
           "wrap tickets into sealed envelope");
    option("node-name", po::value(&config.node_name), "device name for logs");
    return desc;
  }

  EngineConfig readConfig(std::istream &input) {
    EngineConfig config;
    auto desc{configOptions(config)};
    po::variables_map vm;
    po::store(po::parse_config_file(input, desc), vm);
    po::notify(vm);
    for (auto ms : {config.throttle_ms,
                    config.connect_timeout_ms,
                    config.idle_timeout_ms}) {
      if (ms < 0) {
        boost::throw_exception(po::invalid_option_value{std::to_string(ms)});
      }
    }
    if (config.connect_timeout_ms == 0 || config.idle_timeout_ms == 0) {
      boost::throw_exception(po::invalid_option_value{"0"});
    }
    return config;
  }

  std::string defaultNodeName() {
    boost::system::error_code ec;
    auto name{boost::asio::ip::host_name(ec)};
    if (ec || name.empty()) {
      return "Unknown Device";
    }
    return name;
  }
}  // namespace vegam::config
