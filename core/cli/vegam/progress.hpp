/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <fmt/format.h>
#include <future>
#include <memory>

#include "common/human_size.hpp"
#include "transfer/transfer_events.hpp"
#include "transfer/orchestrator.hpp"

namespace vegam::cli::_vegam {
  constexpr size_t kNameWidth{32};

  inline void printProgress(const transfer::TransferRecord &record) {
    fmt::print("\r{} {:>3}% {} / {} {}   ",
               common::truncate(record.file_name, kNameWidth),
               common::progressPercent(record.bytes_transferred,
                                       record.file_size),
               common::formatFileSize(record.bytes_transferred),
               common::formatFileSize(record.file_size),
               common::formatTransferSpeed(record.speed_bytes_per_second));
    std::fflush(stdout);
  }

  /**
   * Prints progress of a transfer and waits for its terminal status.
   * Status is also checked right after subscribing, so a transfer which ended
   * before that is not missed.
   */
  class TransferWaiter : public std::enable_shared_from_this<TransferWaiter> {
   public:
    static std::shared_ptr<TransferWaiter> make(
        transfer::TransferEvents &events,
        transfer::TransferOrchestrator &orchestrator,
        const transfer::TransferId &id) {
      std::shared_ptr<TransferWaiter> waiter{
          new TransferWaiter{orchestrator, id}};
      waiter->progress_ = events.subscribeProgress(id, printProgress);
      waiter->update_ = events.subscribeUpdate(
          id,
          [wptr{waiter->weak_from_this()}](
              const transfer::TransferRecord &record) {
            auto self{wptr.lock()};
            if (self && transfer::isTerminal(record.status)) {
              self->resolve(record);
            }
          });
      if (auto record{orchestrator.getStatus(id)}) {
        if (transfer::isTerminal(record.value().status)) {
          waiter->resolve(record.value());
        }
      }
      return waiter;
    }

    ~TransferWaiter() {
      progress_.disconnect();
      update_.disconnect();
    }

    /// Resolves early, e.g. on interrupt
    void interrupt() {
      if (auto record{orchestrator_.getStatus(id_)}) {
        resolve(record.value());
      }
    }

    transfer::TransferRecord wait() {
      auto record{promise_.get_future().get()};
      fmt::print("\n");
      return record;
    }

   private:
    TransferWaiter(transfer::TransferOrchestrator &orchestrator,
                   const transfer::TransferId &id)
        : orchestrator_{orchestrator}, id_{id} {}

    void resolve(const transfer::TransferRecord &record) {
      if (!resolved_.exchange(true)) {
        promise_.set_value(record);
      }
    }

    transfer::TransferOrchestrator &orchestrator_;
    transfer::TransferId id_;
    std::promise<transfer::TransferRecord> promise_;
    std::atomic_bool resolved_{false};
    transfer::Connection progress_;
    transfer::Connection update_;
  };
}  // namespace vegam::cli::_vegam
