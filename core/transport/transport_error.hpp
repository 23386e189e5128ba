/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace vegam::transport {
  enum class TransportError {
    kImportError = 1,
    kResolveError,
    kFetchError,
    kPeerUnreachable,
    kContentNotFound,
    kIntegrityMismatch,
    kCancelled,
  };
}  // namespace vegam::transport

OUTCOME_HPP_DECLARE_ERROR(vegam::transport, TransportError);
