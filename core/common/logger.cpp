/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace vegam::common {
  spdlog::sink_ptr file_sink;

  namespace {
    std::mutex &registryMutex() {
      static std::mutex mutex;
      return mutex;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    std::lock_guard lock{registryMutex()};
    if (auto existing = spdlog::get(tag)) {
      return existing;
    }
    auto logger = spdlog::stdout_color_mt(tag);
    if (file_sink) {
      logger->sinks().push_back(file_sink);
    }
    logger->set_level(spdlog::get_level());
    return logger;
  }

  spdlog::level::level_enum logLevelFromChar(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
    }
    return spdlog::level::info;
  }
}  // namespace vegam::common
