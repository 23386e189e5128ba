/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/signals2.hpp>
#include <mutex>
#include <unordered_map>

#include "transfer/types.hpp"

namespace vegam::transfer {
  using Connection = boost::signals2::connection;

  /**
   * Publish/subscribe channels for transfer records.
   * Update fires on creation and on every status change, progress fires per
   * throttled sample. Events are delivered one by one through a strand in the
   * order they were signalled, so for a given id the terminal update is the
   * last event. Subscribers keyed by id are released after it, channels left
   * without connected subscribers are pruned when another one is created.
   */
  class TransferEvents : public std::enable_shared_from_this<TransferEvents> {
   public:
    using Callback = void(const TransferRecord &);

    explicit TransferEvents(std::shared_ptr<boost::asio::io_context> io);

    /// Drops events which were not delivered yet
    void stop();

    Connection subscribeUpdate(std::function<Callback> cb);
    Connection subscribeUpdate(const TransferId &id,
                               std::function<Callback> cb);
    Connection subscribeProgress(std::function<Callback> cb);
    Connection subscribeProgress(const TransferId &id,
                                 std::function<Callback> cb);

    /// Number of per-id channels held
    size_t channelCount();

    void signalUpdate(TransferRecord record);
    void signalProgress(TransferRecord record);

   private:
    struct Channel {
      boost::signals2::signal<Callback> update;
      boost::signals2::signal<Callback> progress;
    };

    std::shared_ptr<Channel> channel(const TransferId &id, bool create);
    void deliverUpdate(const TransferRecord &record);
    void deliverProgress(const TransferRecord &record);

    std::shared_ptr<boost::asio::io_context> io_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    std::atomic_bool stopped_{false};

    boost::signals2::signal<Callback> update_signal_;
    boost::signals2::signal<Callback> progress_signal_;

    std::mutex channels_mutex_;
    std::unordered_map<TransferId, std::shared_ptr<Channel>> channels_;
  };
}  // namespace vegam::transfer
