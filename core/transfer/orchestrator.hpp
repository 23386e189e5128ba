/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <mutex>

#include "platform/file_access.hpp"
#include "ticket/ticket.hpp"
#include "transfer/progress_multiplexer.hpp"
#include "transfer/transfer_registry.hpp"
#include "transport/peer_transport.hpp"

namespace vegam::transfer {
  struct OrchestratorConfig {
    /// File name of legacy tickets
    std::string placeholder_name{ticket::kDefaultPlaceholder};
    /// Wrap produced tickets into sealed envelope
    bool seal_tickets{};
  };

  struct SendResult {
    std::string ticket;
    TransferId id;
    std::string file_name;
    uint64_t file_size{};
  };

  /**
   * Public surface of transfer engine.
   * Composes ticket codec, peer transport, progress multiplexer and registry
   * and drives every transfer through its statuses. Errors which happen before
   * a record exists are returned to caller, later ones end up as failed
   * record. Blocking fetches run on fetch_io, which must not be the context
   * delivering events and serving content.
   */
  class TransferOrchestrator
      : public std::enable_shared_from_this<TransferOrchestrator> {
   public:
    TransferOrchestrator(std::shared_ptr<boost::asio::io_context> fetch_io,
                         std::shared_ptr<TransferRegistry> registry,
                         std::shared_ptr<ProgressMultiplexer> multiplexer,
                         std::shared_ptr<transport::PeerTransport> transport,
                         std::shared_ptr<platform::FileAccess> file_access,
                         OrchestratorConfig config);

    /// Unpublishes sent content and cancels running fetches
    ~TransferOrchestrator();

    /**
     * Imports and publishes file, registers send transfer.
     * Content is served in background until cancelled.
     * @return ticket and transfer id, kReadError or transport error
     */
    outcome::result<SendResult> send(const std::string &path);

    /**
     * Starts download and returns without waiting for it.
     * @return transfer id, ticket error, or resolve/open error (the transfer
     * is then recorded as failed too)
     */
    outcome::result<TransferId> receive(const std::string &ticket,
                                        const std::string &output_path);

    outcome::result<TransferRecord> getStatus(const TransferId &id) const;

    std::vector<TransferRecord> list() const;

    /**
     * Requests cooperative cancellation and records it immediately.
     * Destination file may keep partial data.
     */
    outcome::result<void> cancel(const TransferId &id);

    /**
     * Stops serving content of a send, it stays served after completion
     * otherwise. Unfinished send is cancelled.
     * @return kNotFound for unknown id
     */
    outcome::result<void> withdraw(const TransferId &id);

    /// Name and size embedded into (possibly sealed) ticket
    outcome::result<ticket::TicketMetadata> inspect(
        const std::string &ticket) const;

   private:
    struct Active {
      std::shared_ptr<transport::CancelToken> cancel;
      /// set for sends
      boost::optional<std::string> publication_id;
    };

    void fetch(const TransferId &id,
               const transport::PeerContent &content,
               const std::shared_ptr<platform::FileWriter> &writer,
               const std::shared_ptr<transport::CancelToken> &cancel);

    void onServed(const TransferId &id,
                  uint64_t size,
                  const outcome::result<void> &result);

    /// Records failure which happened after registration
    void failTransfer(const TransferId &id, const std::error_code &error);

    /// Forgets transfer, unpublishes content of a send
    void deactivate(const TransferId &id);

    std::shared_ptr<boost::asio::io_context> fetch_io_;
    std::shared_ptr<TransferRegistry> registry_;
    std::shared_ptr<ProgressMultiplexer> multiplexer_;
    std::shared_ptr<transport::PeerTransport> transport_;
    std::shared_ptr<platform::FileAccess> file_access_;
    OrchestratorConfig config_;

    std::mutex active_mutex_;
    std::unordered_map<TransferId, Active> active_;

    common::Logger logger_;
  };
}  // namespace vegam::transfer
