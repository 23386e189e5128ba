/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/orchestrator.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/post.hpp>

#include "ticket/sealed_ticket.hpp"
#include "ticket/ticket_codec.hpp"
#include "transfer/transfer_error.hpp"
#include "transport/transport_error.hpp"

namespace vegam::transfer {
  using transport::CancelToken;
  using transport::TransportError;

  namespace {
    /// Transfer id of published content, known once the record is created
    struct ServeState {
      void set(const TransferId &id) {
        std::lock_guard lock{mutex};
        transfer_id = id;
      }

      boost::optional<TransferId> get() {
        std::lock_guard lock{mutex};
        if (transfer_id.empty()) {
          return boost::none;
        }
        return transfer_id;
      }

      std::mutex mutex;
      TransferId transfer_id;
    };
  }  // namespace

  TransferOrchestrator::TransferOrchestrator(
      std::shared_ptr<boost::asio::io_context> fetch_io,
      std::shared_ptr<TransferRegistry> registry,
      std::shared_ptr<ProgressMultiplexer> multiplexer,
      std::shared_ptr<transport::PeerTransport> transport,
      std::shared_ptr<platform::FileAccess> file_access,
      OrchestratorConfig config)
      : fetch_io_{std::move(fetch_io)},
        registry_{std::move(registry)},
        multiplexer_{std::move(multiplexer)},
        transport_{std::move(transport)},
        file_access_{std::move(file_access)},
        config_{std::move(config)},
        logger_{common::createLogger("Orchestrator")} {}

  TransferOrchestrator::~TransferOrchestrator() {
    std::lock_guard lock{active_mutex_};
    for (auto &[id, active] : active_) {
      active.cancel->cancel();
      if (active.publication_id) {
        transport_->unpublish(*active.publication_id);
      }
    }
  }

  outcome::result<SendResult> TransferOrchestrator::send(
      const std::string &path) {
    OUTCOME_TRY(file_name, file_access_->fileName(path));
    OUTCOME_TRY(estimated_size, file_access_->fileSize(path));
    OUTCOME_TRY(bytes, file_access_->readAll(path));
    const auto file_size{static_cast<uint64_t>(bytes.size())};
    if (file_size != estimated_size) {
      logger_->debug("{} changed size while reading: {} -> {}",
                     path,
                     estimated_size,
                     file_size);
    }

    OUTCOME_TRY(handle, transport_->import(bytes));

    auto state{std::make_shared<ServeState>()};
    transport::ServeHandler handler;
    handler.on_progress = [wptr{weak_from_this()}, state](uint64_t served,
                                                          uint64_t total) {
      auto self{wptr.lock()};
      auto id{state->get()};
      if (self && id) {
        self->multiplexer_->onProgress(*id, served, total);
      }
    };
    handler.on_served = [wptr{weak_from_this()}, state, file_size](
                            outcome::result<void> result) {
      auto self{wptr.lock()};
      auto id{state->get()};
      if (self && id) {
        self->onServed(*id, file_size, result);
      }
    };
    auto publication{transport_->publish(handle, std::move(handler))};
    if (!publication) {
      logger_->warn(
          "cannot publish {}: {}", path, publication.error().message());
      return TransportError::kImportError;
    }
    const auto &locator{publication.value().locator};

    auto encoded{ticket::encodeTicket(file_name, file_size, locator)};
    if (encoded && config_.seal_tickets) {
      encoded = ticket::sealTicket(encoded.value(), transport_->nodeId());
    }
    if (!encoded) {
      transport_->unpublish(publication.value().id);
      return encoded.error();
    }

    auto id{registry_->create(
        TransferDirection::kSend, file_name, file_size, locator)};
    {
      std::lock_guard lock{active_mutex_};
      active_.emplace(id,
                      Active{std::make_shared<CancelToken>(),
                             publication.value().id});
    }
    state->set(id);
    logger_->info("sending '{}' ({} bytes) as {}", file_name, file_size, id);
    return SendResult{encoded.value(), id, file_name, file_size};
  }

  outcome::result<TransferId> TransferOrchestrator::receive(
      const std::string &ticket, const std::string &output_path) {
    OUTCOME_TRY(plain,
                ticket::unsealIfSealed(boost::algorithm::trim_copy(ticket)));
    OUTCOME_TRY(decoded,
                ticket::decodeTicket(plain, config_.placeholder_name));

    auto file_name{decoded.file_name};
    if (decoded.legacy) {
      if (auto name{file_access_->fileName(output_path)}) {
        file_name = name.value();
      }
    }
    auto id{registry_->create(TransferDirection::kReceive,
                              file_name,
                              decoded.file_size,
                              decoded.locator)};

    auto content{transport_->resolve(decoded.locator)};
    if (!content) {
      failTransfer(id, content.error());
      return content.error();
    }
    auto writer{file_access_->openForWrite(output_path)};
    if (!writer) {
      failTransfer(id, writer.error());
      return writer.error();
    }

    auto cancel{std::make_shared<CancelToken>()};
    {
      std::lock_guard lock{active_mutex_};
      active_.emplace(id, Active{cancel, boost::none});
    }
    logger_->info("receiving '{}' into {} as {}", file_name, output_path, id);
    boost::asio::post(
        *fetch_io_,
        [wptr{weak_from_this()},
         id,
         content{std::move(content.value())},
         writer{std::shared_ptr<platform::FileWriter>{
             std::move(writer.value())}},
         cancel] {
          if (auto self{wptr.lock()}) {
            self->fetch(id, content, writer, cancel);
          }
        });
    return id;
  }

  outcome::result<TransferRecord> TransferOrchestrator::getStatus(
      const TransferId &id) const {
    return registry_->get(id);
  }

  std::vector<TransferRecord> TransferOrchestrator::list() const {
    return registry_->list();
  }

  outcome::result<void> TransferOrchestrator::cancel(const TransferId &id) {
    OUTCOME_TRY(record, registry_->get(id));
    if (record.status == TransferStatus::kCancelled) {
      return outcome::success();
    }
    if (isTerminal(record.status)) {
      return TransferError::kInvalidTransition;
    }
    {
      std::lock_guard lock{active_mutex_};
      auto it{active_.find(id)};
      if (it != active_.end()) {
        it->second.cancel->cancel();
      }
    }
    deactivate(id);
    multiplexer_->forget(id);
    return registry_->cancel(id);
  }

  outcome::result<void> TransferOrchestrator::withdraw(const TransferId &id) {
    OUTCOME_TRY(record, registry_->get(id));
    if (!isTerminal(record.status)) {
      return cancel(id);
    }
    if (record.direction == TransferDirection::kSend) {
      deactivate(id);
    }
    return outcome::success();
  }

  outcome::result<ticket::TicketMetadata> TransferOrchestrator::inspect(
      const std::string &ticket) const {
    OUTCOME_TRY(plain,
                ticket::unsealIfSealed(boost::algorithm::trim_copy(ticket)));
    return ticket::parseMetadataOnly(plain);
  }

  void TransferOrchestrator::fetch(
      const TransferId &id,
      const transport::PeerContent &content,
      const std::shared_ptr<platform::FileWriter> &writer,
      const std::shared_ptr<CancelToken> &cancel) {
    auto fetched{transport_->fetch(
        content,
        *writer,
        [multiplexer{multiplexer_}, id](uint64_t bytes, uint64_t total) {
          multiplexer->onProgress(id, bytes, total);
        },
        *cancel)};
    deactivate(id);

    if (fetched) {
      multiplexer_->finish(id, fetched.value());
      if (auto res{registry_->complete(id)}; !res) {
        logger_->debug(
            "completion of {} ignored: {}", id, res.error().message());
      }
      return;
    }

    multiplexer_->forget(id);
    if (auto closed{writer->close()}; !closed) {
      logger_->debug(
          "close of {} destination: {}", id, closed.error().message());
    }
    if (fetched.error() == TransportError::kCancelled || cancel->cancelled()) {
      if (auto res{registry_->cancel(id)}; !res) {
        logger_->debug("cancel of {} ignored: {}", id, res.error().message());
      }
      return;
    }
    failTransfer(id, fetched.error());
  }

  void TransferOrchestrator::onServed(const TransferId &id,
                                      uint64_t size,
                                      const outcome::result<void> &result) {
    if (result) {
      multiplexer_->finish(id, size);
      if (auto res{registry_->complete(id)}; !res) {
        logger_->debug("delivery of {} after {}", id, res.error().message());
      }
      return;
    }
    logger_->error("serving {} failed: {}", id, result.error().message());
    if (auto res{registry_->fail(id, result.error().message())}; !res) {
      logger_->debug("serve failure of {} ignored: {}",
                     id,
                     res.error().message());
      return;
    }
    multiplexer_->forget(id);
    deactivate(id);
  }

  void TransferOrchestrator::failTransfer(const TransferId &id,
                                          const std::error_code &error) {
    if (auto res{registry_->fail(id, error.message())}; !res) {
      logger_->debug("failure of {} ignored: {}", id, res.error().message());
    }
  }

  void TransferOrchestrator::deactivate(const TransferId &id) {
    std::lock_guard lock{active_mutex_};
    auto it{active_.find(id)};
    if (it == active_.end()) {
      return;
    }
    if (it->second.publication_id) {
      transport_->unpublish(*it->second.publication_id);
    }
    active_.erase(it);
  }
}  // namespace vegam::transfer
