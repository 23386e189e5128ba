/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "ticket/ticket.hpp"

namespace vegam::ticket {
  /**
   * Encodes enhanced ticket "<file_name>|<file_size>|<locator>".
   * Separators inside the file name are replaced, so the three field shape
   * always survives.
   * @param file_name - human readable name, may be empty
   * @param file_size - size in bytes
   * @param locator - transport locator, must be non-empty and free of
   * separator
   * @return ticket string or kInvalidLocator
   */
  outcome::result<std::string> encodeTicket(const std::string &file_name,
                                            uint64_t file_size,
                                            const std::string &locator);

  /**
   * Decodes enhanced or legacy ticket.
   * Anything which does not have the enhanced shape is treated as bare
   * locator equal to the whole (trimmed) input.
   * @param ticket - ticket string, surrounding whitespace is ignored
   * @param placeholder - file name for legacy tickets
   * @return decoded ticket or kInvalidTicket for empty input
   */
  outcome::result<Ticket> decodeTicket(
      std::string_view ticket,
      const std::string &placeholder = kDefaultPlaceholder);

  /**
   * Extracts name and size without touching transport.
   * @return metadata, kMetadataUnavailable for legacy ticket or
   * kInvalidTicket for empty one
   */
  outcome::result<TicketMetadata> parseMetadataOnly(std::string_view ticket);
}  // namespace vegam::ticket
