/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

namespace vegam::common {
  /**
   * Formats byte count with 1024 based units, at most two decimals.
   * Example: 1536 -> "1.5 KB", 0 -> "0 Bytes"
   */
  std::string formatFileSize(uint64_t bytes);

  /// Same as formatFileSize with "/s" suffix
  std::string formatTransferSpeed(double bytes_per_second);

  /// Rounded percentage, 0 when total is unknown
  int progressPercent(uint64_t transferred, uint64_t total);

  /// Cuts string to max_length characters ending with "..."
  std::string truncate(const std::string &str, size_t max_length);
}  // namespace vegam::common
