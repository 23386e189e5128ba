/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/blob_store.hpp"

#include "crypto/sha/sha256.hpp"

namespace vegam::transport {
  std::string BlobStore::put(BytesIn bytes) {
    auto id{crypto::sha::sha256Hex(bytes)};
    std::unique_lock lock{mutex_};
    auto &entry{blobs_[id]};
    if (!entry.blob) {
      entry.blob = std::make_shared<const Bytes>(copy(bytes));
    }
    ++entry.refs;
    return id;
  }

  BlobPtr BlobStore::get(const std::string &content_id) const {
    std::shared_lock lock{mutex_};
    auto it{blobs_.find(content_id)};
    if (it == blobs_.end()) {
      return nullptr;
    }
    return it->second.blob;
  }

  bool BlobStore::contains(const std::string &content_id) const {
    std::shared_lock lock{mutex_};
    return blobs_.count(content_id) != 0;
  }

  void BlobStore::release(const std::string &content_id) {
    std::unique_lock lock{mutex_};
    auto it{blobs_.find(content_id)};
    if (it != blobs_.end() && --it->second.refs == 0) {
      blobs_.erase(it);
    }
  }

  size_t BlobStore::size() const {
    std::shared_lock lock{mutex_};
    return blobs_.size();
  }
}  // namespace vegam::transport
