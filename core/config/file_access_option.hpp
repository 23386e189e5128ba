/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options/value_semantic.hpp>

#include "platform/file_access.hpp"

namespace vegam::platform {
  /// Parses "local" or "uri" option values
  inline void validate(boost::any &out,
                       const std::vector<std::string> &values,
                       FileAccessKind *,
                       long) {
    using namespace boost::program_options;
    check_first_occurrence(out);
    auto &value{get_single_string(values)};
    if (auto kind{common::from_string<FileAccessKind>(value)}) {
      out = *kind;
      return;
    }
    boost::throw_exception(invalid_option_value{value});
  }
}  // namespace vegam::platform
