/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "platform/file_access_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vegam::platform, FileAccessError, e) {
  using vegam::platform::FileAccessError;
  switch (e) {
    case FileAccessError::kReadError:
      return "FileAccess: cannot read file";
    case FileAccessError::kWriteError:
      return "FileAccess: cannot write file";
    case FileAccessError::kUnsupportedUri:
      return "FileAccess: unsupported uri";
  }
  return "FileAccess: unknown error";
}
