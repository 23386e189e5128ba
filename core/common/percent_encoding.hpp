/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <string>
#include <string_view>

namespace vegam::common {
  /**
   * Decodes "%XX" escapes byte by byte, multibyte utf-8 sequences come out
   * as they were encoded.
   * @return decoded string or none on truncated or non-hex escape
   */
  boost::optional<std::string> percentDecode(std::string_view input);
}  // namespace vegam::common
