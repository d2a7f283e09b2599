/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "metrics/metrics.hpp"

#include <gmock/gmock.h>

namespace ratemon::metrics {

  class CounterMock : public Counter {
   public:
    MOCK_METHOD(void, inc, (), (override));

    MOCK_METHOD(bool, add, (double), (override));

    MOCK_METHOD(double, value, (), (const, override));
  };

  class GaugeMock : public Gauge {
   public:
    MOCK_METHOD(void, inc, (), (override));

    MOCK_METHOD(void, inc, (double), (override));

    MOCK_METHOD(void, dec, (), (override));

    MOCK_METHOD(void, dec, (double), (override));

    MOCK_METHOD(void, set, (double), (override));

    MOCK_METHOD(double, value, (), (const, override));
  };

}  // namespace ratemon::metrics
