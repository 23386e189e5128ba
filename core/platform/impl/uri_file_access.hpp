/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "platform/file_access.hpp"

namespace vegam::platform {
  /**
   * Accepts plain paths and "file://" uris with percent-encoding, e.g.
   * "file:///tmp/My%20File.txt" or "file://localhost/tmp/a.txt".
   * Other schemes give kUnsupportedUri.
   */
  class UriFileAccess : public FileAccess {
   public:
    explicit UriFileAccess(std::shared_ptr<FileAccess> local);

    /// Maps uri or plain path to local path
    static outcome::result<std::string> toPath(const std::string &uri);

    outcome::result<std::string> fileName(
        const std::string &path) const override;

    outcome::result<uint64_t> fileSize(const std::string &path) const override;

    outcome::result<Bytes> readAll(const std::string &path) const override;

    outcome::result<std::unique_ptr<FileWriter>> openForWrite(
        const std::string &path) const override;

   private:
    std::shared_ptr<FileAccess> local_;
  };
}  // namespace vegam::platform
