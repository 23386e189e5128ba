/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ticket/ticket_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vegam::ticket, TicketError, e) {
  using vegam::ticket::TicketError;
  switch (e) {
    case TicketError::kInvalidTicket:
      return "Ticket: empty or malformed ticket";
    case TicketError::kMetadataUnavailable:
      return "Ticket: legacy ticket carries no file name and size";
    case TicketError::kInvalidLocator:
      return "Ticket: locator is empty or contains separator";
    case TicketError::kSealedTicketMalformed:
      return "Ticket: sealed ticket is malformed";
    case TicketError::kSealedTicketUndecryptable:
      return "Ticket: sealed ticket cannot be decrypted";
  }
  return "Ticket: unknown error";
}
