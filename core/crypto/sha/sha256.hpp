/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <openssl/sha.h>
#include <array>
#include <string>

#include "common/bytes.hpp"

namespace vegam::crypto::sha {
  using Hash256 = std::array<uint8_t, 32u>;

  Hash256 sha256(BytesIn input);

  /// Lowercase hex of sha256 digest
  std::string sha256Hex(BytesIn input);

  std::string toHex(const Hash256 &hash);

  /// Incremental hashing of streamed content
  class Sha256Hasher {
   public:
    Sha256Hasher();
    void update(BytesIn input);
    Hash256 finalize();

   private:
    SHA256_CTX ctx_;
  };
}  // namespace vegam::crypto::sha
