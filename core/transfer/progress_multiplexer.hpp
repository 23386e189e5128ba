/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>

#include "clock/steady_clock.hpp"
#include "transfer/transfer_registry.hpp"

namespace vegam::transfer {
  constexpr std::chrono::milliseconds kDefaultThrottleInterval{100};

  /**
   * Converts raw transport byte counters into throttled registry updates
   * annotated with speed.
   * Sample is emitted when it is the first one of a transfer, when throttle
   * interval passed since previous emission, or when it reaches known total.
   * Lock order is multiplexer then registry.
   */
  class ProgressMultiplexer {
   public:
    ProgressMultiplexer(std::shared_ptr<TransferRegistry> registry,
                        std::shared_ptr<clock::SteadyClock> clock,
                        std::chrono::milliseconds throttle_interval);

    /**
     * Feeds raw sample.
     * @param bytes - bytes so far
     * @param total - total bytes if known, zero otherwise
     * @return true if sample was emitted
     */
    bool onProgress(const TransferId &id, uint64_t bytes, uint64_t total);

    /// Emits final sample unless already emitted and forgets the transfer
    void finish(const TransferId &id, uint64_t total);

    /// Forgets the transfer without emitting
    void forget(const TransferId &id);

   private:
    struct Emitted {
      clock::milliseconds time;
      uint64_t bytes;
    };

    bool emit(const TransferId &id,
              uint64_t bytes,
              uint64_t total,
              bool force);

    std::shared_ptr<TransferRegistry> registry_;
    std::shared_ptr<clock::SteadyClock> clock_;
    std::chrono::milliseconds throttle_interval_;

    std::mutex mutex_;
    std::unordered_map<TransferId, Emitted> last_;

    common::Logger logger_;
  };
}  // namespace vegam::transfer
