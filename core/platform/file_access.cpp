/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "platform/file_access.hpp"

#include "platform/impl/local_file_access.hpp"
#include "platform/impl/uri_file_access.hpp"

namespace vegam::platform {
  std::shared_ptr<FileAccess> makeFileAccess(FileAccessKind kind) {
    if (kind == FileAccessKind::kUri) {
      return std::make_shared<UriFileAccess>(
          std::make_shared<LocalFileAccess>());
    }
    return std::make_shared<LocalFileAccess>();
  }
}  // namespace vegam::platform
