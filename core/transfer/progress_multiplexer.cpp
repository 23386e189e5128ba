/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/progress_multiplexer.hpp"

namespace vegam::transfer {
  ProgressMultiplexer::ProgressMultiplexer(
      std::shared_ptr<TransferRegistry> registry,
      std::shared_ptr<clock::SteadyClock> clock,
      std::chrono::milliseconds throttle_interval)
      : registry_{std::move(registry)},
        clock_{std::move(clock)},
        throttle_interval_{throttle_interval},
        logger_{common::createLogger("ProgressMultiplexer")} {}

  bool ProgressMultiplexer::onProgress(const TransferId &id,
                                       uint64_t bytes,
                                       uint64_t total) {
    std::lock_guard lock{mutex_};
    return emit(id, bytes, total, false);
  }

  void ProgressMultiplexer::finish(const TransferId &id, uint64_t total) {
    std::lock_guard lock{mutex_};
    auto it{last_.find(id)};
    if (it == last_.end() || it->second.bytes < total) {
      emit(id, total, total, true);
    }
    last_.erase(id);
  }

  void ProgressMultiplexer::forget(const TransferId &id) {
    std::lock_guard lock{mutex_};
    last_.erase(id);
  }

  bool ProgressMultiplexer::emit(const TransferId &id,
                                 uint64_t bytes,
                                 uint64_t total,
                                 bool force) {
    const auto now{clock_->nowMilli()};
    auto it{last_.find(id)};
    const auto first{it == last_.end()};
    const auto terminal{total != 0 && bytes >= total};
    if (!first && !force && !terminal
        && now - it->second.time < throttle_interval_) {
      return false;
    }

    boost::optional<double> speed;
    if (!first && now > it->second.time) {
      const auto delta{bytes > it->second.bytes ? bytes - it->second.bytes
                                                : 0};
      speed = static_cast<double>(delta) * 1000.0
              / static_cast<double>((now - it->second.time).count());
    }

    boost::optional<uint64_t> size;
    if (total != 0) {
      size = total;
    }
    auto res{registry_->updateProgress(id, bytes, size, speed)};
    if (!res) {
      logger_->debug("drop sample {}/{} of {}: {}",
                     bytes,
                     total,
                     id,
                     res.error().message());
      return false;
    }
    last_[id] = Emitted{now, bytes};
    return true;
  }
}  // namespace vegam::transfer
