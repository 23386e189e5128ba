/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/algorithm/string/trim.hpp>

#include "cli/cli.hpp"
#include "common/human_size.hpp"
#include "ticket/sealed_ticket.hpp"
#include "ticket/ticket_codec.hpp"
#include "ticket/ticket_error.hpp"

namespace vegam::cli::_vegam {
  /// Reads ticket metadata offline, transport is not started
  struct Vegam_inspect {
    struct Args {
      CLI_OPTS() {
        return {};
      }
    };

    CLI_RUN() {
      const auto ticket{
          boost::algorithm::trim_copy(cliArgv(argv, 0, "ticket"))};
      if (ticket::isSealedTicket(ticket)) {
        fmt::print("sealed: yes\n");
      }
      const auto plain{
          cliTry(ticket::unsealIfSealed(ticket), "unseal ticket")};
      auto metadata{ticket::parseMetadataOnly(plain)};
      if (!metadata
          && metadata.error() == ticket::TicketError::kMetadataUnavailable) {
        const auto decoded{cliTry(ticket::decodeTicket(plain))};
        fmt::print("legacy ticket, name and size unknown\nlocator: {}\n",
                   decoded.locator);
        return;
      }
      const auto value{cliTry(std::move(metadata), "inspect ticket")};
      fmt::print("name: {}\nsize: {} ({} bytes)\n",
                 value.file_name,
                 common::formatFileSize(value.file_size),
                 value.file_size);
    }
  };
}  // namespace vegam::cli::_vegam
