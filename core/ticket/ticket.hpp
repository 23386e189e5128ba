/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

namespace vegam::ticket {
  /// Separates file name, size and locator in enhanced ticket
  constexpr char kSeparator{'|'};

  /// Replaces separator occurrences in file names
  constexpr char kSeparatorReplacement{'_'};

  /// File name of legacy tickets unless caller supplies another one
  inline const std::string kDefaultPlaceholder{"received_file"};

  /**
   * Decoded ticket.
   * Legacy ticket is a bare locator, its name is the placeholder and size is
   * zero (unknown until transport reports it).
   */
  struct Ticket {
    std::string file_name;
    uint64_t file_size{};
    std::string locator;
    bool legacy{};
  };
  inline bool operator==(const Ticket &l, const Ticket &r) {
    return l.file_name == r.file_name && l.file_size == r.file_size
           && l.locator == r.locator && l.legacy == r.legacy;
  }

  /// Metadata embedded into enhanced ticket
  struct TicketMetadata {
    std::string file_name;
    uint64_t file_size{};
  };
  inline bool operator==(const TicketMetadata &l, const TicketMetadata &r) {
    return l.file_name == r.file_name && l.file_size == r.file_size;
  }
}  // namespace vegam::ticket
