/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace vegam::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /// Optional sink shared by every logger, set up by the application
  extern spdlog::sink_ptr file_sink;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Maps single letter log level used on command line to spdlog level
   * @param level - one of 'e', 'w', 'i', 'd', 't'
   */
  spdlog::level::level_enum logLevelFromChar(char level);
}  // namespace vegam::common
