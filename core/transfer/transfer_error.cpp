/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/transfer_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vegam::transfer, TransferError, e) {
  using vegam::transfer::TransferError;
  switch (e) {
    case TransferError::kNotFound:
      return "Transfer: transfer not found";
    case TransferError::kInvalidTransition:
      return "Transfer: transition is not allowed from current status";
  }
  return "Transfer: unknown error";
}
