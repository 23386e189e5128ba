/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "common/outcome.hpp"

namespace vegam::ticket {
  constexpr std::string_view kSealedPrefix{"vegam://"};

  /// Checks prefix only
  bool isSealedTicket(std::string_view ticket);

  /**
   * Wraps ticket into "vegam://<node_id>:<payload>" envelope.
   * Payload is base64url (no padding) of nonce || ciphertext || tag,
   * AES-256-GCM keyed with digest of node id.
   * Envelope hides ticket contents from casual inspection, it is not access
   * control.
   */
  outcome::result<std::string> sealTicket(std::string_view ticket,
                                          const std::string &node_id);

  /**
   * Restores ticket from envelope.
   * @return ticket, kSealedTicketMalformed or kSealedTicketUndecryptable
   */
  outcome::result<std::string> unsealTicket(std::string_view sealed);

  /// Unseals envelope or returns plain ticket as is
  outcome::result<std::string> unsealIfSealed(std::string_view ticket);
}  // namespace vegam::ticket
