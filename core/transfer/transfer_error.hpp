/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace vegam::transfer {
  enum class TransferError {
    kNotFound = 1,
    kInvalidTransition,
  };
}  // namespace vegam::transfer

OUTCOME_HPP_DECLARE_ERROR(vegam::transfer, TransferError);
