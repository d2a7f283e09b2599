/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/clock_impl.hpp"

#include <thread>

namespace ratemon::clock {

  template <typename ClockType>
  typename ClockImpl<ClockType>::TimePoint ClockImpl<ClockType>::now() const {
    return ClockType::now();
  }

  template <typename ClockType>
  void ClockImpl<ClockType>::sleepUntil(TimePoint time_point) const {
    if (ClockType::now() < time_point) {
      std::this_thread::sleep_until(time_point);
    }
  }

  template class ClockImpl<std::chrono::steady_clock>;

}  // namespace ratemon::clock
