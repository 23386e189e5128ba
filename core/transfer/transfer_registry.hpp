/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/uuid/random_generator.hpp>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "common/logger.hpp"
#include "common/outcome.hpp"
#include "fsm/transition.hpp"
#include "transfer/transfer_events.hpp"
#include "transfer/types.hpp"

namespace vegam::transfer {
  /// Events which move transfer record between statuses
  enum class TransferEvent {
    kProgress = 1,
    kComplete,
    kFail,
    kCancel,
  };

  using TransferTransitionTable =
      fsm::TransitionTable<TransferEvent, TransferStatus>;

  /// Pending -> in progress -> {completed, failed, cancelled}
  TransferTransitionTable makeTransferTransitions();

  /**
   * Process lifetime storage of transfer records.
   * Sole owner of records, hands out copies. Every mutation together with its
   * event signal happens under one exclusive lock, so signalled events follow
   * mutation order.
   */
  class TransferRegistry {
   public:
    /// @param events - may be null when nobody listens
    explicit TransferRegistry(std::shared_ptr<TransferEvents> events);

    /// Inserts pending record and signals update
    TransferId create(TransferDirection direction,
                      const std::string &file_name,
                      uint64_t file_size,
                      const std::string &locator);

    outcome::result<TransferRecord> get(const TransferId &id) const;

    /**
     * Applies progress sample.
     * Moves pending record to in progress. Bytes never decrease and are
     * clamped to known file size.
     * @param bytes - bytes transferred so far
     * @param file_size - size correction, ignored when zero
     * @param speed - bytes per second
     * @return kNotFound or kInvalidTransition for terminal record
     */
    outcome::result<void> updateProgress(
        const TransferId &id,
        uint64_t bytes,
        boost::optional<uint64_t> file_size = boost::none,
        boost::optional<double> speed = boost::none);

    /// Terminal transitions. Repeating the same one is a no-op, switching to
    /// another terminal status is kInvalidTransition.
    outcome::result<void> complete(const TransferId &id);
    outcome::result<void> fail(const TransferId &id, const std::string &error);
    outcome::result<void> cancel(const TransferId &id);

    /// Snapshot ordered by creation
    std::vector<TransferRecord> list() const;

   private:
    outcome::result<void> finish(const TransferId &id,
                                 TransferEvent event,
                                 const boost::optional<std::string> &error);

    std::shared_ptr<TransferEvents> events_;
    const TransferTransitionTable transitions_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<TransferId, TransferRecord> records_;
    uint64_t next_sequence_{};
    boost::uuids::random_generator uuid_generator_;

    common::Logger logger_;
  };
}  // namespace vegam::transfer
