/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/steady_clock_impl.hpp"

namespace vegam::clock {
  milliseconds SteadyClockImpl::nowMilli() const {
    return std::chrono::duration_cast<milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch());
  }
}  // namespace vegam::clock
