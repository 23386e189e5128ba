/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace vegam::clock {
  using std::chrono::milliseconds;

  /**
   * Provides monotonic time, used for rate computations where wall clock
   * adjustments must not matter
   */
  class SteadyClock {
   public:
    virtual milliseconds nowMilli() const = 0;
    virtual ~SteadyClock() = default;
  };
}  // namespace vegam::clock
