/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ticket/ticket_codec.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/optional.hpp>
#include <algorithm>
#include <limits>
#include <vector>

#include "ticket/ticket_error.hpp"

namespace vegam::ticket {
  namespace {
    constexpr size_t kEnhancedParts{3};

    /// Strict unsigned base 10 parser, no sign, no spaces
    boost::optional<uint64_t> parseSize(std::string_view str) {
      if (str.empty()) {
        return boost::none;
      }
      uint64_t value{};
      for (auto c : str) {
        if (c < '0' || c > '9') {
          return boost::none;
        }
        const uint64_t digit = c - '0';
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
          return boost::none;
        }
        value = value * 10 + digit;
      }
      return value;
    }
  }  // namespace

  outcome::result<std::string> encodeTicket(const std::string &file_name,
                                            uint64_t file_size,
                                            const std::string &locator) {
    if (locator.empty() || locator.find(kSeparator) != std::string::npos) {
      return TicketError::kInvalidLocator;
    }
    auto name = file_name;
    std::replace(name.begin(), name.end(), kSeparator, kSeparatorReplacement);
    std::string ticket;
    ticket.reserve(name.size() + locator.size() + 24);
    ticket.append(name)
        .append(1, kSeparator)
        .append(std::to_string(file_size))
        .append(1, kSeparator)
        .append(locator);
    return ticket;
  }

  outcome::result<Ticket> decodeTicket(std::string_view ticket,
                                       const std::string &placeholder) {
    const auto trimmed =
        boost::algorithm::trim_copy(std::string{ticket.begin(), ticket.end()});
    if (trimmed.empty()) {
      return TicketError::kInvalidTicket;
    }

    std::vector<std::string> parts;
    boost::algorithm::split(
        parts, trimmed, boost::algorithm::is_any_of(std::string{kSeparator}));
    if (parts.size() == kEnhancedParts && not parts[2].empty()) {
      if (auto size = parseSize(parts[1])) {
        return Ticket{parts[0].empty() ? placeholder : parts[0],
                      *size,
                      parts[2],
                      false};
      }
    }

    // legacy locator, the whole input is kept including separators
    return Ticket{placeholder, 0, trimmed, true};
  }

  outcome::result<TicketMetadata> parseMetadataOnly(std::string_view ticket) {
    OUTCOME_TRY(decoded, decodeTicket(ticket));
    if (decoded.legacy) {
      return TicketError::kMetadataUnavailable;
    }
    return TicketMetadata{std::move(decoded.file_name), decoded.file_size};
  }
}  // namespace vegam::ticket
