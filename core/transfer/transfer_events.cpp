/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/transfer_events.hpp"

#include <boost/asio/post.hpp>

namespace vegam::transfer {
  TransferEvents::TransferEvents(std::shared_ptr<boost::asio::io_context> io)
      : io_{std::move(io)}, strand_{io_->get_executor()} {}

  void TransferEvents::stop() {
    stopped_ = true;
  }

  Connection TransferEvents::subscribeUpdate(std::function<Callback> cb) {
    return update_signal_.connect(cb);
  }

  Connection TransferEvents::subscribeUpdate(const TransferId &id,
                                             std::function<Callback> cb) {
    return channel(id, true)->update.connect(cb);
  }

  Connection TransferEvents::subscribeProgress(std::function<Callback> cb) {
    return progress_signal_.connect(cb);
  }

  Connection TransferEvents::subscribeProgress(const TransferId &id,
                                               std::function<Callback> cb) {
    return channel(id, true)->progress.connect(cb);
  }

  size_t TransferEvents::channelCount() {
    std::lock_guard lock{channels_mutex_};
    return channels_.size();
  }

  void TransferEvents::signalUpdate(TransferRecord record) {
    boost::asio::post(strand_,
                      [wptr{weak_from_this()}, record{std::move(record)}] {
                        if (auto self{wptr.lock()}; self && !self->stopped_) {
                          self->deliverUpdate(record);
                        }
                      });
  }

  void TransferEvents::signalProgress(TransferRecord record) {
    boost::asio::post(strand_,
                      [wptr{weak_from_this()}, record{std::move(record)}] {
                        if (auto self{wptr.lock()}; self && !self->stopped_) {
                          self->deliverProgress(record);
                        }
                      });
  }

  std::shared_ptr<TransferEvents::Channel> TransferEvents::channel(
      const TransferId &id, bool create) {
    std::lock_guard lock{channels_mutex_};
    auto it{channels_.find(id)};
    if (it != channels_.end()) {
      return it->second;
    }
    if (!create) {
      return nullptr;
    }
    // subscribed after the terminal update or to an unknown id
    for (auto unused{channels_.begin()}; unused != channels_.end();) {
      if (unused->second->update.empty() && unused->second->progress.empty()) {
        unused = channels_.erase(unused);
      } else {
        ++unused;
      }
    }
    return channels_.emplace(id, std::make_shared<Channel>()).first->second;
  }

  void TransferEvents::deliverUpdate(const TransferRecord &record) {
    update_signal_(record);
    if (auto ch{channel(record.id, false)}) {
      ch->update(record);
      if (isTerminal(record.status)) {
        std::lock_guard lock{channels_mutex_};
        channels_.erase(record.id);
      }
    }
  }

  void TransferEvents::deliverProgress(const TransferRecord &record) {
    progress_signal_(record);
    if (auto ch{channel(record.id, false)}) {
      ch->progress(record);
    }
  }
}  // namespace vegam::transfer
