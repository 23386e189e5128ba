/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/percent_encoding.hpp"

namespace vegam::common {
  namespace {
    int hexDigit(char c) {
      if (c >= '0' && c <= '9') {
        return c - '0';
      }
      if (c >= 'a' && c <= 'f') {
        return 10 + c - 'a';
      }
      if (c >= 'A' && c <= 'F') {
        return 10 + c - 'A';
      }
      return -1;
    }
  }  // namespace

  boost::optional<std::string> percentDecode(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
      if (input[i] != '%') {
        result.push_back(input[i]);
        continue;
      }
      if (i + 2 >= input.size()) {
        return boost::none;
      }
      auto high{hexDigit(input[i + 1])};
      auto low{hexDigit(input[i + 2])};
      if (high < 0 || low < 0) {
        return boost::none;
      }
      result.push_back(static_cast<char>((high << 4) | low));
      i += 2;
    }
    return result;
  }
}  // namespace vegam::common
