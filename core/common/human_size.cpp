/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/human_size.hpp"

#include <array>
#include <cmath>
#include <fmt/format.h>

namespace vegam::common {
  constexpr std::array<const char *, 5> kUnits{
      "Bytes", "KB", "MB", "GB", "TB"};

  std::string formatFileSize(uint64_t bytes) {
    if (bytes == 0) {
      return "0 Bytes";
    }
    size_t unit = 0;
    auto value = static_cast<double>(bytes);
    while (value >= 1024 && unit + 1 < kUnits.size()) {
      value /= 1024;
      ++unit;
    }
    const auto rounded = std::round(value * 100) / 100;
    return fmt::format("{} {}", rounded, kUnits[unit]);
  }

  std::string formatTransferSpeed(double bytes_per_second) {
    const auto bytes =
        bytes_per_second > 0 ? static_cast<uint64_t>(bytes_per_second) : 0;
    return formatFileSize(bytes) + "/s";
  }

  int progressPercent(uint64_t transferred, uint64_t total) {
    if (total == 0) {
      return 0;
    }
    return static_cast<int>(std::lround(static_cast<double>(transferred) * 100
                                        / static_cast<double>(total)));
  }

  std::string truncate(const std::string &str, size_t max_length) {
    if (str.size() <= max_length) {
      return str;
    }
    if (max_length <= 3) {
      return str.substr(0, max_length);
    }
    return str.substr(0, max_length - 3) + "...";
  }
}  // namespace vegam::common
