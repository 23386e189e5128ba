/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <shared_mutex>
#include <unordered_map>

#include "common/bytes.hpp"

namespace vegam::transport {
  using BlobPtr = std::shared_ptr<const Bytes>;

  /**
   * In-memory content addressed storage, keyed by sha256 hex.
   * Blob is reference counted, every put takes a reference and every release
   * drops one, blob is erased with the last one.
   */
  class BlobStore {
   public:
    /// Stores bytes once, @return content id
    std::string put(BytesIn bytes);

    /// @return blob or nullptr
    BlobPtr get(const std::string &content_id) const;

    bool contains(const std::string &content_id) const;

    void release(const std::string &content_id);

    size_t size() const;

   private:
    struct Entry {
      BlobPtr blob;
      size_t refs{};
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> blobs_;
  };
}  // namespace vegam::transport
