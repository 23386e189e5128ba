/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace vegam::platform {
  enum class FileAccessError {
    kReadError = 1,
    kWriteError,
    kUnsupportedUri,
  };
}  // namespace vegam::platform

OUTCOME_HPP_DECLARE_ERROR(vegam::platform, FileAccessError);
