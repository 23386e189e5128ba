/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <boost/algorithm/hex.hpp>
#include <iterator>

namespace vegam::crypto::sha {
  Hash256 sha256(BytesIn input) {
    Sha256Hasher hasher;
    hasher.update(input);
    return hasher.finalize();
  }

  std::string sha256Hex(BytesIn input) {
    return toHex(sha256(input));
  }

  std::string toHex(const Hash256 &hash) {
    std::string hex;
    hex.reserve(hash.size() * 2);
    boost::algorithm::hex_lower(
        hash.begin(), hash.end(), std::back_inserter(hex));
    return hex;
  }

  Sha256Hasher::Sha256Hasher() {
    SHA256_Init(&ctx_);
  }

  void Sha256Hasher::update(BytesIn input) {
    SHA256_Update(&ctx_, input.data(), input.size());
  }

  Hash256 Sha256Hasher::finalize() {
    Hash256 out;
    SHA256_Final(out.data(), &ctx_);
    return out;
  }
}  // namespace vegam::crypto::sha
