/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/logger.hpp"
#include "platform/file_access.hpp"

namespace vegam::platform {
  /// Plain filesystem paths
  class LocalFileAccess : public FileAccess {
   public:
    LocalFileAccess();

    outcome::result<std::string> fileName(
        const std::string &path) const override;

    outcome::result<uint64_t> fileSize(const std::string &path) const override;

    outcome::result<Bytes> readAll(const std::string &path) const override;

    outcome::result<std::unique_ptr<FileWriter>> openForWrite(
        const std::string &path) const override;

   private:
    common::Logger logger_;
  };
}  // namespace vegam::platform
