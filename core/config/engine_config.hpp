/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options/options_description.hpp>
#include <chrono>
#include <iosfwd>
#include <string>

#include "platform/file_access.hpp"
#include "ticket/ticket.hpp"

namespace vegam::config {
  struct EngineConfig {
    int64_t throttle_ms{100};
    std::string placeholder_name{ticket::kDefaultPlaceholder};
    std::string listen_host{"0.0.0.0"};
    std::string advertise_host{"127.0.0.1"};
    uint16_t listen_port{};
    std::string download_dir{"."};
    platform::FileAccessKind file_access{platform::FileAccessKind::kLocal};
    size_t io_threads{2};
    size_t fetch_threads{2};
    int64_t connect_timeout_ms{10000};
    int64_t idle_timeout_ms{30000};
    bool seal_tickets{};
    std::string node_name;

    std::chrono::milliseconds throttleInterval() const {
      return std::chrono::milliseconds{throttle_ms};
    }

    std::chrono::milliseconds connectTimeout() const {
      return std::chrono::milliseconds{connect_timeout_ms};
    }

    std::chrono::milliseconds idleTimeout() const {
      return std::chrono::milliseconds{idle_timeout_ms};
    }
  };

  /// Options bound to fields of config, used for config files
  boost::program_options::options_description configOptions(
      EngineConfig &config);

  /**
   * Reads INI-style config.
   * Missing keys keep defaults, unknown keys are rejected.
   * @throws boost::program_options::error on invalid values
   */
  EngineConfig readConfig(std::istream &input);

  /// Host name or "Unknown Device"
  std::string defaultNodeName();
}  // namespace vegam::config
