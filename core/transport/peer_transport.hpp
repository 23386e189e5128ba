/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "platform/file_access.hpp"

namespace vegam::transport {
  /// Cooperative cancellation flag checked by transport at chunk boundaries
  class CancelToken {
   public:
    void cancel() {
      cancelled_ = true;
    }

    bool cancelled() const {
      return cancelled_;
    }

   private:
    std::atomic_bool cancelled_{false};
  };

  struct ContentHandle {
    std::string content_id;
    uint64_t size{};
  };

  struct PeerAddress {
    std::string host;
    uint16_t port{};
  };

  struct PeerContent {
    PeerAddress peer;
    std::string content_id;
    /// Publication the content is served under
    std::string publication_id;
  };

  /// One act of serving content, same content may be published many times
  struct Publication {
    std::string id;
    /// Shareable, free of '|'
    std::string locator;
  };

  /// (bytes so far, total bytes or zero if unknown)
  using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

  /// Callbacks of published content, invoked on transport threads
  struct ServeHandler {
    /// progress of a single delivery to a peer
    ProgressCallback on_progress;
    /// delivery to a peer finished or failed
    std::function<void(outcome::result<void>)> on_served;
  };

  /**
   * Moves content between peers.
   * Imported content is pinned until it is published, publish takes the pin
   * over even when it fails. Every publication has own locator and own serve
   * handler, content is released once its last publication is withdrawn.
   * Receiver resolves locator and fetches content.
   */
  class PeerTransport {
   public:
    virtual ~PeerTransport() = default;

    /// Stable identifier of local node, free of ':'
    virtual std::string nodeId() const = 0;

    /// @return handle or kImportError
    virtual outcome::result<ContentHandle> import(BytesIn bytes) = 0;

    /// Makes content servable, @return publication or kImportError
    virtual outcome::result<Publication> publish(const ContentHandle &handle,
                                                 ServeHandler handler) = 0;

    /// Withdraws single publication, other publications keep serving
    virtual void unpublish(const std::string &publication_id) = 0;

    /// @return peer and content or kResolveError
    virtual outcome::result<PeerContent> resolve(
        const std::string &locator) const = 0;

    /**
     * Streams content to writer, blocks until done, cancelled or timed out.
     * @return number of bytes fetched, transport error, or writer error
     */
    virtual outcome::result<uint64_t> fetch(
        const PeerContent &content,
        platform::FileWriter &writer,
        const ProgressCallback &on_progress,
        const CancelToken &cancel) = 0;
  };
}  // namespace vegam::transport
