/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace ratemon::clock {

  /// Clock reading the std::chrono clock and sleeping the calling thread
  template <typename ClockType>
  class ClockImpl final : public Clock<ClockType> {
   public:
    using TimePoint = typename Clock<ClockType>::TimePoint;

    TimePoint now() const override;
    void sleepUntil(TimePoint time_point) const override;
  };

  using SteadyClockImpl = ClockImpl<std::chrono::steady_clock>;

}  // namespace ratemon::clock
