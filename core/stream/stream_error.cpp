/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "stream/stream_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ratemon::stream, StreamError, e) {
  using E = ratemon::stream::StreamError;
  switch (e) {
    case E::ZERO_INTERVAL:
      return "Tap interval must be positive";
  }
  return "Unknown stream::StreamError";
}
