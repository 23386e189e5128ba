/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include "common/bytes.hpp"
#include "common/enum.hpp"
#include "common/outcome.hpp"

namespace vegam::platform {
  /// Sequential writer of destination file
  class FileWriter {
   public:
    virtual ~FileWriter() = default;

    virtual outcome::result<void> write(BytesIn bytes) = 0;

    /// Flushes and closes, further writes fail
    virtual outcome::result<void> close() = 0;
  };

  /**
   * Access to files by opaque path string.
   * Implementations decide which path forms they accept.
   */
  class FileAccess {
   public:
    virtual ~FileAccess() = default;

    /// Last path component shown to peers
    virtual outcome::result<std::string> fileName(
        const std::string &path) const = 0;

    virtual outcome::result<uint64_t> fileSize(
        const std::string &path) const = 0;

    virtual outcome::result<Bytes> readAll(const std::string &path) const = 0;

    /// Creates or truncates file, parent directories are created
    virtual outcome::result<std::unique_ptr<FileWriter>> openForWrite(
        const std::string &path) const = 0;
  };

  enum class FileAccessKind {
    kLocal = 1,
    kUri,
  };

  inline auto &class_conversion_table(FileAccessKind &&) {
    using E = FileAccessKind;
    static common::ConversionTable<E, 2> table{
        {{E::kLocal, "local"}, {E::kUri, "uri"}}};
    return table;
  }

  std::shared_ptr<FileAccess> makeFileAccess(FileAccessKind kind);
}  // namespace vegam::platform
