/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <cstdint>
#include <string>

#include "common/enum.hpp"

namespace vegam::transfer {
  /// RFC 4122 text form of random uuid
  using TransferId = std::string;

  enum class TransferDirection {
    kSend = 1,
    kReceive,
  };

  inline auto &class_conversion_table(TransferDirection &&) {
    using E = TransferDirection;
    static common::ConversionTable<E, 2> table{
        {{E::kSend, "send"}, {E::kReceive, "receive"}}};
    return table;
  }

  enum class TransferStatus {
    kPending = 1,
    kInProgress,
    kCompleted,
    kFailed,
    kCancelled,
  };

  inline auto &class_conversion_table(TransferStatus &&) {
    using E = TransferStatus;
    static common::ConversionTable<E, 5> table{
        {{E::kPending, "pending"},
         {E::kInProgress, "in progress"},
         {E::kCompleted, "completed"},
         {E::kFailed, "failed"},
         {E::kCancelled, "cancelled"}}};
    return table;
  }

  inline bool isTerminal(TransferStatus status) {
    return status == TransferStatus::kCompleted
           || status == TransferStatus::kFailed
           || status == TransferStatus::kCancelled;
  }

  struct TransferRecord {
    TransferId id;
    TransferDirection direction{};
    std::string file_name;
    /// zero when unknown
    uint64_t file_size{};
    uint64_t bytes_transferred{};
    double speed_bytes_per_second{};
    TransferStatus status{TransferStatus::kPending};
    /// set iff status is failed
    boost::optional<std::string> error;
    std::string locator;
    /// creation sequence number, defines listing order
    uint64_t created_at{};
  };
}  // namespace vegam::transfer
