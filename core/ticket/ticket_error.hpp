/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace vegam::ticket {
  enum class TicketError {
    kInvalidTicket = 1,
    kMetadataUnavailable,
    kInvalidLocator,
    kSealedTicketMalformed,
    kSealedTicketUndecryptable,
  };
}  // namespace vegam::ticket

OUTCOME_HPP_DECLARE_ERROR(vegam::ticket, TicketError);
