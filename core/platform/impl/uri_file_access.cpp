/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "platform/impl/uri_file_access.hpp"

#include "common/percent_encoding.hpp"
#include "platform/file_access_error.hpp"

namespace vegam::platform {
  namespace {
    constexpr std::string_view kFileScheme{"file://"};
    constexpr std::string_view kLocalhost{"localhost"};
    constexpr std::string_view kSchemeDelimiter{"://"};
  }  // namespace

  UriFileAccess::UriFileAccess(std::shared_ptr<FileAccess> local)
      : local_{std::move(local)} {}

  outcome::result<std::string> UriFileAccess::toPath(const std::string &uri) {
    std::string_view view{uri};
    if (view.substr(0, kFileScheme.size()) != kFileScheme) {
      auto delimiter{view.find(kSchemeDelimiter)};
      auto slash{view.find('/')};
      if (delimiter != std::string_view::npos && delimiter != 0
          && (slash == std::string_view::npos || delimiter < slash)) {
        return FileAccessError::kUnsupportedUri;
      }
      return uri;
    }
    view.remove_prefix(kFileScheme.size());
    if (view.substr(0, kLocalhost.size()) == kLocalhost) {
      view.remove_prefix(kLocalhost.size());
    }
    if (view.empty() || view.front() != '/') {
      return FileAccessError::kUnsupportedUri;
    }
    auto decoded{common::percentDecode(view)};
    if (!decoded) {
      return FileAccessError::kUnsupportedUri;
    }
    return *decoded;
  }

  outcome::result<std::string> UriFileAccess::fileName(
      const std::string &path) const {
    OUTCOME_TRY(local, toPath(path));
    return local_->fileName(local);
  }

  outcome::result<uint64_t> UriFileAccess::fileSize(
      const std::string &path) const {
    OUTCOME_TRY(local, toPath(path));
    return local_->fileSize(local);
  }

  outcome::result<Bytes> UriFileAccess::readAll(const std::string &path) const {
    OUTCOME_TRY(local, toPath(path));
    return local_->readAll(local);
  }

  outcome::result<std::unique_ptr<FileWriter>> UriFileAccess::openForWrite(
      const std::string &path) const {
    OUTCOME_TRY(local, toPath(path));
    return local_->openForWrite(local);
  }
}  // namespace vegam::platform
