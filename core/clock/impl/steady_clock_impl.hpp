/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/steady_clock.hpp"

namespace vegam::clock {
  class SteadyClockImpl : public SteadyClock {
   public:
    milliseconds nowMilli() const override;
  };
}  // namespace vegam::clock
