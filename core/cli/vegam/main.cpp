/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cli/run.hpp"
#include "cli/vegam/inspect.hpp"
#include "cli/vegam/receive.hpp"
#include "cli/vegam/send.hpp"

#define CMD(NAME, TYPE) \
  { NAME, tree<TYPE>() }

namespace vegam::cli::_vegam {
  const auto _tree{tree<Vegam>({
      CMD("send", Vegam_send),
      CMD("receive", Vegam_receive),
      CMD("inspect", Vegam_inspect),
  })};
}  // namespace vegam::cli::_vegam

int main(int argc, const char *argv[]) {
  return vegam::cli::run("vegam", vegam::cli::_vegam::_tree, argc, argv);
}
