/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace ratemon::clock {

  /**
   * Source of time for rate sampling. Waiting goes through the clock as well,
   * so that a mocked clock controls both.
   * @tparam ClockType underlying std::chrono clock
   */
  template <typename ClockType>
  class Clock {
   public:
    using Duration = typename ClockType::duration;
    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    /**
     * @return current time point
     */
    virtual TimePoint now() const = 0;

    /**
     * Blocks the calling thread until `time_point` is reached. Returns at
     * once for a time point in the past.
     */
    virtual void sleepUntil(TimePoint time_point) const = 0;

    static TimePoint zero() {
      return TimePoint{};
    }
  };

  /// Monotonic clock, used to measure sampling intervals
  using SteadyClock = Clock<std::chrono::steady_clock>;

}  // namespace ratemon::clock
