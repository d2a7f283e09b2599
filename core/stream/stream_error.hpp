/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace ratemon::stream {

  enum class StreamError : uint8_t {
    ZERO_INTERVAL = 1,
  };

}  // namespace ratemon::stream

OUTCOME_HPP_DECLARE_ERROR(ratemon::stream, StreamError);
