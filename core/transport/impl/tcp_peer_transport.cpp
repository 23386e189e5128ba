/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/impl/tcp_peer_transport.hpp"

#include <openssl/rand.h>
#include <algorithm>
#include <array>
#include <boost/algorithm/hex.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <boost/endian/conversion.hpp>
#include <iterator>
#include <vector>

#include "crypto/sha/sha256.hpp"
#include "transport/transport_error.hpp"

namespace vegam::transport {
  namespace net = boost::asio;
  using net::ip::tcp;

  namespace {
    constexpr size_t kContentIdSize{64};
    constexpr size_t kPublicationIdBytes{8};
    constexpr size_t kPublicationIdSize{kPublicationIdBytes * 2};
    constexpr size_t kMaxRequestSize{kContentIdSize + kPublicationIdSize + 3};
    constexpr size_t kNodeIdBytes{16};
    /// How often blocked fetch looks at its cancel token
    constexpr std::chrono::milliseconds kCancelPollInterval{50};

    boost::optional<std::string> randomHex(size_t bytes) {
      std::vector<uint8_t> random(bytes);
      if (RAND_bytes(random.data(), static_cast<int>(random.size())) != 1) {
        return boost::none;
      }
      std::string hex;
      boost::algorithm::hex_lower(
          random.begin(), random.end(), std::back_inserter(hex));
      return hex;
    }

    bool isHex(std::string_view str) {
      return std::all_of(str.begin(), str.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
      });
    }

    std::array<uint8_t, 8> encodeLength(uint64_t length) {
      std::array<uint8_t, 8> out{};
      boost::endian::store_big_u64(out.data(), length);
      return out;
    }

    /// One incoming request, owns socket until response is written
    struct ServeSession : std::enable_shared_from_this<ServeSession> {
      ServeSession(tcp::socket &&socket,
                   std::weak_ptr<TcpPeerTransport> transport,
                   common::Logger logger)
          : socket{std::move(socket)},
            transport{std::move(transport)},
            request{kMaxRequestSize},
            logger{std::move(logger)} {}

      void run() {
        net::async_read_until(
            socket,
            request,
            '\n',
            [self{shared_from_this()}](auto ec, auto size) {
              if (ec) {
                self->logger->debug("read request: {}", ec.message());
                return;
              }
              self->onRequest(size);
            });
      }

      void onRequest(size_t size) {
        std::string line{net::buffers_begin(request.data()),
                         net::buffers_begin(request.data()) + size - 1};
        request.consume(size);
        if (!line.empty() && line.back() == '\r') {
          line.pop_back();
        }
        std::string content_id, publication_id;
        if (auto colon{line.find(':')}; colon != std::string::npos) {
          content_id = line.substr(0, colon);
          publication_id = line.substr(colon + 1);
        }

        auto transport_ptr{transport.lock()};
        if (transport_ptr) {
          auto published{transport_ptr->published(publication_id)};
          if (published && published->content_id == content_id) {
            blob = transport_ptr->store()->get(content_id);
            handler = std::move(published->handler);
          }
        }
        if (!blob) {
          logger->debug("requested content {} is not served", line);
          length = encodeLength(kNotFoundLength);
          net::async_write(socket,
                           net::buffer(length),
                           [self{shared_from_this()}](auto, auto) {
                             self->close();
                           });
          return;
        }

        logger->info("serving {} ({} bytes) to {}",
                     line,
                     blob->size(),
                     remote());
        length = encodeLength(blob->size());
        net::async_write(socket,
                         net::buffer(length),
                         [self{shared_from_this()}](auto ec, auto) {
                           if (ec) {
                             return self->onServed(ec);
                           }
                           self->report();
                           self->writeChunk();
                         });
      }

      void writeChunk() {
        if (offset == blob->size()) {
          return onServed({});
        }
        auto size{std::min(kChunkSize, blob->size() - offset)};
        net::async_write(socket,
                         net::buffer(blob->data() + offset, size),
                         [self{shared_from_this()}](auto ec, auto written) {
                           if (ec) {
                             return self->onServed(ec);
                           }
                           self->offset += written;
                           self->report();
                           self->writeChunk();
                         });
      }

      void report() {
        if (handler.on_progress) {
          handler.on_progress(offset, blob->size());
        }
      }

      void onServed(boost::system::error_code ec) {
        if (ec) {
          logger->warn("serve to {} failed: {}", remote(), ec.message());
        }
        if (handler.on_served) {
          if (ec) {
            handler.on_served(TransportError::kFetchError);
          } else {
            handler.on_served(outcome::success());
          }
        }
        close();
      }

      void close() {
        boost::system::error_code ec;
        socket.shutdown(tcp::socket::shutdown_send, ec);
        socket.close(ec);
      }

      std::string remote() const {
        boost::system::error_code ec;
        auto endpoint{socket.remote_endpoint(ec)};
        if (ec) {
          return "unknown peer";
        }
        return endpoint.address().to_string() + ":"
               + std::to_string(endpoint.port());
      }

      tcp::socket socket;
      std::weak_ptr<TcpPeerTransport> transport;
      net::streambuf request;
      std::array<uint8_t, 8> length{};
      BlobPtr blob;
      ServeHandler handler;
      size_t offset{};
      common::Logger logger;
    };

    /// Blocking client over async operations of a private io_context
    struct FetchClient {
      explicit FetchClient(const CancelToken &cancel) : cancel{cancel} {}

      /// Completion of the awaited operation
      void complete(const boost::system::error_code &error) {
        ec = error;
        done = true;
      }

      /**
       * Runs io until the started operation completes. Socket is closed when
       * transfer is cancelled or deadline passes.
       * @return kCancelled, or error on failure and deadline
       */
      outcome::result<void> await(std::chrono::milliseconds timeout,
                                  TransportError error) {
        io.restart();
        const auto deadline{std::chrono::steady_clock::now() + timeout};
        while (!done) {
          io.run_for(kCancelPollInterval);
          if (done) {
            break;
          }
          timed_out = std::chrono::steady_clock::now() >= deadline;
          if (cancel.cancelled() || timed_out) {
            boost::system::error_code ignored;
            resolver.cancel();
            socket.close(ignored);
            io.run();
            if (cancel.cancelled()) {
              return TransportError::kCancelled;
            }
            return error;
          }
        }
        done = false;
        if (ec) {
          return error;
        }
        return outcome::success();
      }

      /// Reason of the last failure for logs
      std::string reason() const {
        return timed_out ? "timed out" : ec.message();
      }

      const CancelToken &cancel;
      net::io_context io;
      tcp::resolver resolver{io};
      tcp::socket socket{io};
      boost::system::error_code ec;
      bool done{false};
      bool timed_out{false};
    };
  }  // namespace

  std::string makeLocator(const PeerContent &content) {
    return std::string{kLocatorPrefix} + content.peer.host + ":"
           + std::to_string(content.peer.port) + ":" + content.content_id + ":"
           + content.publication_id;
  }

  outcome::result<PeerContent> parseLocator(const std::string &locator) {
    std::string_view view{locator};
    if (view.substr(0, kLocatorPrefix.size()) != kLocatorPrefix) {
      return TransportError::kResolveError;
    }
    view.remove_prefix(kLocatorPrefix.size());

    auto publication_colon{view.rfind(':')};
    if (publication_colon == std::string_view::npos) {
      return TransportError::kResolveError;
    }
    auto publication_id{view.substr(publication_colon + 1)};
    if (publication_id.size() != kPublicationIdSize || !isHex(publication_id)) {
      return TransportError::kResolveError;
    }
    view = view.substr(0, publication_colon);

    auto id_colon{view.rfind(':')};
    if (id_colon == std::string_view::npos) {
      return TransportError::kResolveError;
    }
    auto content_id{view.substr(id_colon + 1)};
    if (content_id.size() != kContentIdSize || !isHex(content_id)) {
      return TransportError::kResolveError;
    }
    view = view.substr(0, id_colon);

    auto port_colon{view.rfind(':')};
    if (port_colon == std::string_view::npos || port_colon == 0) {
      return TransportError::kResolveError;
    }
    auto port_str{view.substr(port_colon + 1)};
    if (port_str.empty() || port_str.size() > 5
        || !std::all_of(port_str.begin(), port_str.end(), [](char c) {
             return c >= '0' && c <= '9';
           })) {
      return TransportError::kResolveError;
    }
    auto port{std::stoul(std::string{port_str})};
    if (port == 0 || port > 65535) {
      return TransportError::kResolveError;
    }

    return PeerContent{
        PeerAddress{std::string{view.substr(0, port_colon)},
                    static_cast<uint16_t>(port)},
        std::string{content_id},
        std::string{publication_id}};
  }

  outcome::result<std::shared_ptr<TcpPeerTransport>> TcpPeerTransport::create(
      std::shared_ptr<boost::asio::io_context> io,
      std::shared_ptr<BlobStore> store,
      const TcpTransportConfig &config) {
    auto log{common::createLogger("TcpTransport")};
    boost::system::error_code ec;
    auto address{net::ip::make_address(config.listen_host, ec)};
    if (ec) {
      log->error(
          "invalid listen host {}: {}", config.listen_host, ec.message());
      return TransportError::kImportError;
    }
    tcp::acceptor acceptor{*io};
    tcp::endpoint endpoint{address, config.listen_port};
    acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
      acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
      acceptor.bind(endpoint, ec);
    }
    if (!ec) {
      acceptor.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
      log->error("cannot listen on {}:{}: {}",
                 config.listen_host,
                 config.listen_port,
                 ec.message());
      return TransportError::kImportError;
    }

    auto node_id{randomHex(kNodeIdBytes)};
    if (!node_id) {
      return TransportError::kImportError;
    }

    return std::shared_ptr<TcpPeerTransport>{
        new TcpPeerTransport{std::move(io),
                             std::move(store),
                             std::move(acceptor),
                             config,
                             std::move(*node_id)}};
  }

  TcpPeerTransport::TcpPeerTransport(
      std::shared_ptr<boost::asio::io_context> io,
      std::shared_ptr<BlobStore> store,
      boost::asio::ip::tcp::acceptor acceptor,
      const TcpTransportConfig &config,
      std::string node_id)
      : io_{std::move(io)},
        store_{std::move(store)},
        acceptor_{std::move(acceptor)},
        advertise_host_{config.advertise_host},
        connect_timeout_{config.connect_timeout},
        idle_timeout_{config.idle_timeout},
        node_id_{std::move(node_id)},
        logger_{common::createLogger("TcpTransport")} {}

  void TcpPeerTransport::start() {
    logger_->info("listening on port {}, node {}", port(), node_id_);
    doAccept();
  }

  void TcpPeerTransport::stop() {
    net::post(acceptor_.get_executor(), [self{shared_from_this()}] {
      boost::system::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  uint16_t TcpPeerTransport::port() const {
    boost::system::error_code ec;
    auto endpoint{acceptor_.local_endpoint(ec)};
    return ec ? 0 : endpoint.port();
  }

  void TcpPeerTransport::doAccept() {
    acceptor_.async_accept([wptr{weak_from_this()}](auto ec, auto socket) {
      auto self{wptr.lock()};
      if (!self) {
        return;
      }
      if (ec) {
        if (ec != net::error::operation_aborted) {
          self->logger_->warn("accept: {}", ec.message());
        }
        if (!self->acceptor_.is_open()) {
          return;
        }
      } else {
        std::make_shared<ServeSession>(
            std::move(socket), self->weak_from_this(), self->logger_)
            ->run();
      }
      self->doAccept();
    });
  }

  std::string TcpPeerTransport::nodeId() const {
    return node_id_;
  }

  outcome::result<ContentHandle> TcpPeerTransport::import(BytesIn bytes) {
    auto id{store_->put(bytes)};
    logger_->debug("imported {} bytes as {}", bytes.size(), id);
    return ContentHandle{std::move(id), static_cast<uint64_t>(bytes.size())};
  }

  outcome::result<Publication> TcpPeerTransport::publish(
      const ContentHandle &handle, ServeHandler handler) {
    auto publication_id{randomHex(kPublicationIdBytes)};
    if (!publication_id || !store_->contains(handle.content_id)
        || !acceptor_.is_open()) {
      store_->release(handle.content_id);
      return TransportError::kImportError;
    }
    {
      std::lock_guard lock{published_mutex_};
      published_.emplace(*publication_id,
                         Published{handle.content_id, std::move(handler)});
    }
    logger_->debug("published {} as {}", handle.content_id, *publication_id);
    auto locator{makeLocator(PeerContent{PeerAddress{advertise_host_, port()},
                                         handle.content_id,
                                         *publication_id})};
    return Publication{std::move(*publication_id), std::move(locator)};
  }

  void TcpPeerTransport::unpublish(const std::string &publication_id) {
    std::string content_id;
    {
      std::lock_guard lock{published_mutex_};
      auto it{published_.find(publication_id)};
      if (it == published_.end()) {
        return;
      }
      content_id = std::move(it->second.content_id);
      published_.erase(it);
    }
    store_->release(content_id);
  }

  boost::optional<TcpPeerTransport::Published> TcpPeerTransport::published(
      const std::string &publication_id) const {
    std::lock_guard lock{published_mutex_};
    auto it{published_.find(publication_id)};
    if (it == published_.end()) {
      return boost::none;
    }
    return it->second;
  }

  const std::shared_ptr<BlobStore> &TcpPeerTransport::store() const {
    return store_;
  }

  outcome::result<PeerContent> TcpPeerTransport::resolve(
      const std::string &locator) const {
    return parseLocator(locator);
  }

  outcome::result<uint64_t> TcpPeerTransport::fetch(
      const PeerContent &content,
      platform::FileWriter &writer,
      const ProgressCallback &on_progress,
      const CancelToken &cancel) {
    FetchClient client{cancel};
    auto &socket{client.socket};

    tcp::resolver::results_type endpoints;
    client.resolver.async_resolve(
        content.peer.host,
        std::to_string(content.peer.port),
        [&](auto ec, auto results) {
          endpoints = std::move(results);
          client.complete(ec);
        });
    auto connected{
        client.await(connect_timeout_, TransportError::kPeerUnreachable)};
    if (connected) {
      net::async_connect(socket, endpoints, [&](auto ec, auto) {
        client.complete(ec);
      });
      connected =
          client.await(connect_timeout_, TransportError::kPeerUnreachable);
    }
    if (!connected) {
      logger_->warn("connect {}:{}: {}",
                    content.peer.host,
                    content.peer.port,
                    client.reason());
      return connected.error();
    }

    const auto request{content.content_id + ":" + content.publication_id
                       + "\n"};
    net::async_write(socket, net::buffer(request), [&](auto ec, auto) {
      client.complete(ec);
    });
    OUTCOME_TRY(client.await(idle_timeout_, TransportError::kFetchError));

    std::array<uint8_t, 8> length_bytes{};
    net::async_read(socket, net::buffer(length_bytes), [&](auto ec, auto) {
      client.complete(ec);
    });
    if (auto header{client.await(idle_timeout_, TransportError::kFetchError)};
        !header) {
      logger_->warn("fetch {} header: {}", content.content_id, client.reason());
      return header.error();
    }
    const auto total{boost::endian::load_big_u64(length_bytes.data())};
    if (total == kNotFoundLength) {
      return TransportError::kContentNotFound;
    }
    if (on_progress) {
      on_progress(0, total);
    }

    crypto::sha::Sha256Hasher hasher;
    Bytes chunk(kChunkSize);
    uint64_t received{};
    while (received < total) {
      if (cancel.cancelled()) {
        return TransportError::kCancelled;
      }
      auto size{static_cast<size_t>(
          std::min<uint64_t>(chunk.size(), total - received))};
      size_t read{};
      socket.async_read_some(net::buffer(chunk.data(), size),
                             [&](auto ec, auto bytes) {
                               read = bytes;
                               client.complete(ec);
                             });
      if (auto piece_read{
              client.await(idle_timeout_, TransportError::kFetchError)};
          !piece_read) {
        logger_->warn("fetch {} interrupted at {}/{}: {}",
                      content.content_id,
                      received,
                      total,
                      client.reason());
        return piece_read.error();
      }
      auto piece{
          gsl::make_span(chunk).subspan(0, static_cast<ptrdiff_t>(read))};
      OUTCOME_TRY(writer.write(piece));
      hasher.update(piece);
      received += read;
      if (on_progress) {
        on_progress(received, total);
      }
    }

    if (crypto::sha::toHex(hasher.finalize()) != content.content_id) {
      return TransportError::kIntegrityMismatch;
    }
    OUTCOME_TRY(writer.close());
    return received;
  }
}  // namespace vegam::transport
