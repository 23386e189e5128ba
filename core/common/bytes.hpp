/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>
#include <vector>

namespace vegam {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = gsl::span<const uint8_t>;

  inline Bytes copy(BytesIn r) {
    return {r.begin(), r.end()};
  }
  void copy(Bytes &&) = delete;

  inline void append(Bytes &l, BytesIn r) {
    l.insert(l.end(), r.begin(), r.end());
  }

  namespace common::span {
    inline BytesIn cbytes(std::string_view s) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const uint8_t *>(s.data()), s.size()};
    }

    inline const char *bytestr(const uint8_t *p) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return reinterpret_cast<const char *>(p);
    }

    inline char *bytestr(uint8_t *p) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return reinterpret_cast<char *>(p);
    }

    inline std::string_view bytestr(BytesIn bytes) {
      return {bytestr(bytes.data()), bytes.size()};
    }
  }  // namespace common::span
}  // namespace vegam
