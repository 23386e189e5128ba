/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/optional.hpp>
#include <chrono>
#include <mutex>
#include <unordered_map>

#include "common/logger.hpp"
#include "transport/blob_store.hpp"
#include "transport/peer_transport.hpp"

namespace vegam::transport {
  constexpr std::string_view kLocatorPrefix{"blob:"};
  constexpr size_t kChunkSize{64 << 10};
  /// Length prefix value meaning content is not served
  constexpr uint64_t kNotFoundLength{~uint64_t{0}};

  struct TcpTransportConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{};
    /// Host written into locators
    std::string advertise_host{"127.0.0.1"};
    /// Deadline of resolving and connecting to a peer
    std::chrono::milliseconds connect_timeout{10000};
    /// Deadline of every single read while fetching
    std::chrono::milliseconds idle_timeout{30000};
  };

  /// "blob:<host>:<port>:<sha256 hex>:<publication id>"
  std::string makeLocator(const PeerContent &content);

  /// Parses locator from the right, host may contain ':'
  outcome::result<PeerContent> parseLocator(const std::string &locator);

  /**
   * Serves published blobs over plain TCP.
   * Request is "<content id>:<publication id>\n", response is 8 byte
   * big-endian length followed by content in chunks. Fetch is a blocking
   * client on its own io_context, closed on cancel or deadline.
   */
  class TcpPeerTransport
      : public PeerTransport,
        public std::enable_shared_from_this<TcpPeerTransport> {
   public:
    struct Published {
      std::string content_id;
      ServeHandler handler;
    };

    /// Binds listening socket, serving starts with start()
    static outcome::result<std::shared_ptr<TcpPeerTransport>> create(
        std::shared_ptr<boost::asio::io_context> io,
        std::shared_ptr<BlobStore> store,
        const TcpTransportConfig &config);

    void start();
    void stop();

    /// Actual listening port
    uint16_t port() const;

    std::string nodeId() const override;

    outcome::result<ContentHandle> import(BytesIn bytes) override;

    outcome::result<Publication> publish(const ContentHandle &handle,
                                         ServeHandler handler) override;

    void unpublish(const std::string &publication_id) override;

    outcome::result<PeerContent> resolve(
        const std::string &locator) const override;

    outcome::result<uint64_t> fetch(const PeerContent &content,
                                    platform::FileWriter &writer,
                                    const ProgressCallback &on_progress,
                                    const CancelToken &cancel) override;

    /// Content and serve handler of publication or none
    boost::optional<Published> published(
        const std::string &publication_id) const;

    const std::shared_ptr<BlobStore> &store() const;

   private:
    TcpPeerTransport(std::shared_ptr<boost::asio::io_context> io,
                     std::shared_ptr<BlobStore> store,
                     boost::asio::ip::tcp::acceptor acceptor,
                     const TcpTransportConfig &config,
                     std::string node_id);

    void doAccept();

    std::shared_ptr<boost::asio::io_context> io_;
    std::shared_ptr<BlobStore> store_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::string advertise_host_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds idle_timeout_;
    std::string node_id_;

    mutable std::mutex published_mutex_;
    std::unordered_map<std::string, Published> published_;

    common::Logger logger_;
  };
}  // namespace vegam::transport
