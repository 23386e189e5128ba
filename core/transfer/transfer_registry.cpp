/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/transfer_registry.hpp"

#include <algorithm>
#include <boost/uuid/uuid_io.hpp>

#include "transfer/transfer_error.hpp"

namespace vegam::transfer {
  using TransitionRule = TransferTransitionTable::TransitionRule;

  TransferTransitionTable makeTransferTransitions() {
    using S = TransferStatus;
    return TransferTransitionTable{{
        TransitionRule{TransferEvent::kProgress}
            .fromMany(S::kPending, S::kInProgress)
            .to(S::kInProgress),
        TransitionRule{TransferEvent::kComplete}
            .fromMany(S::kPending, S::kInProgress)
            .to(S::kCompleted),
        TransitionRule{TransferEvent::kFail}
            .fromMany(S::kPending, S::kInProgress)
            .to(S::kFailed),
        TransitionRule{TransferEvent::kCancel}
            .fromMany(S::kPending, S::kInProgress)
            .to(S::kCancelled),
    }};
  }

  namespace {
    TransferStatus terminalStatus(TransferEvent event) {
      switch (event) {
        case TransferEvent::kComplete:
          return TransferStatus::kCompleted;
        case TransferEvent::kFail:
          return TransferStatus::kFailed;
        case TransferEvent::kCancel:
          return TransferStatus::kCancelled;
        default:
          return TransferStatus::kInProgress;
      }
    }
  }  // namespace

  TransferRegistry::TransferRegistry(std::shared_ptr<TransferEvents> events)
      : events_{std::move(events)},
        transitions_{makeTransferTransitions()},
        logger_{common::createLogger("TransferRegistry")} {}

  TransferId TransferRegistry::create(TransferDirection direction,
                                      const std::string &file_name,
                                      uint64_t file_size,
                                      const std::string &locator) {
    std::unique_lock lock{mutex_};
    TransferRecord record;
    do {
      record.id = boost::uuids::to_string(uuid_generator_());
    } while (records_.count(record.id) != 0);
    record.direction = direction;
    record.file_name = file_name;
    record.file_size = file_size;
    record.locator = locator;
    record.created_at = next_sequence_++;
    auto &stored{records_.emplace(record.id, std::move(record)).first->second};
    logger_->debug("created {} transfer {} for '{}' ({} bytes)",
                   *common::to_string(direction),
                   stored.id,
                   stored.file_name,
                   stored.file_size);
    if (events_) {
      events_->signalUpdate(stored);
    }
    return stored.id;
  }

  outcome::result<TransferRecord> TransferRegistry::get(
      const TransferId &id) const {
    std::shared_lock lock{mutex_};
    auto it{records_.find(id)};
    if (it == records_.end()) {
      return TransferError::kNotFound;
    }
    return it->second;
  }

  outcome::result<void> TransferRegistry::updateProgress(
      const TransferId &id,
      uint64_t bytes,
      boost::optional<uint64_t> file_size,
      boost::optional<double> speed) {
    std::unique_lock lock{mutex_};
    auto it{records_.find(id)};
    if (it == records_.end()) {
      return TransferError::kNotFound;
    }
    auto &record{it->second};
    auto next{transitions_.dispatch(TransferEvent::kProgress, record.status)};
    if (!next) {
      logger_->debug("ignore progress of {} transfer {}",
                     *common::to_string(record.status),
                     id);
      return TransferError::kInvalidTransition;
    }

    const auto status_changed{record.status != *next};
    record.status = *next;
    if (file_size && *file_size != 0) {
      record.file_size = *file_size;
    }
    record.bytes_transferred = std::max(record.bytes_transferred, bytes);
    if (record.file_size != 0) {
      record.bytes_transferred =
          std::min(record.bytes_transferred, record.file_size);
    }
    if (speed) {
      record.speed_bytes_per_second = *speed;
    }

    if (events_) {
      if (status_changed) {
        events_->signalUpdate(record);
      }
      events_->signalProgress(record);
    }
    return outcome::success();
  }

  outcome::result<void> TransferRegistry::complete(const TransferId &id) {
    return finish(id, TransferEvent::kComplete, boost::none);
  }

  outcome::result<void> TransferRegistry::fail(const TransferId &id,
                                               const std::string &error) {
    return finish(id, TransferEvent::kFail, error);
  }

  outcome::result<void> TransferRegistry::cancel(const TransferId &id) {
    return finish(id, TransferEvent::kCancel, boost::none);
  }

  std::vector<TransferRecord> TransferRegistry::list() const {
    std::vector<TransferRecord> result;
    {
      std::shared_lock lock{mutex_};
      result.reserve(records_.size());
      for (auto &[id, record] : records_) {
        result.push_back(record);
      }
    }
    std::sort(result.begin(), result.end(), [](auto &l, auto &r) {
      return l.created_at < r.created_at;
    });
    return result;
  }

  outcome::result<void> TransferRegistry::finish(
      const TransferId &id,
      TransferEvent event,
      const boost::optional<std::string> &error) {
    std::unique_lock lock{mutex_};
    auto it{records_.find(id)};
    if (it == records_.end()) {
      return TransferError::kNotFound;
    }
    auto &record{it->second};
    auto next{transitions_.dispatch(event, record.status)};
    if (!next) {
      if (record.status == terminalStatus(event)) {
        return outcome::success();
      }
      logger_->warn("transfer {} is already {}, cannot become {}",
                    id,
                    *common::to_string(record.status),
                    *common::to_string(terminalStatus(event)));
      return TransferError::kInvalidTransition;
    }

    record.status = *next;
    record.error = error;
    if (record.status == TransferStatus::kCompleted && record.file_size != 0) {
      record.bytes_transferred = record.file_size;
    }
    if (record.status != TransferStatus::kCompleted) {
      record.speed_bytes_per_second = 0;
    }

    if (record.status == TransferStatus::kCompleted) {
      logger_->info("transfer {} completed, {} bytes",
                    id,
                    record.bytes_transferred);
    } else if (error) {
      logger_->warn("transfer {} failed: {}", id, *error);
    } else {
      logger_->warn("transfer {} cancelled", id);
    }
    if (events_) {
      events_->signalUpdate(record);
    }
    return outcome::success();
  }
}  // namespace vegam::transfer
