/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "stream/stream.hpp"
#include "stream/stream_error.hpp"

namespace ratemon::stream {

  /**
   * @brief runs `action` on every `interval`-th element and passes the stream
   * through unchanged
   * @param interval number of elements between two actions, must be positive
   * @param action callable `const T & -> outcome::result<void>`, invoked
   * before the element it is given is emitted; its error fails the pull
   * @return tapped stream, or StreamError::ZERO_INTERVAL
   */
  template <typename T, typename Action>
  outcome::result<Stream<T>> doAt(size_t interval,
                                  Action action,
                                  Stream<T> source) {
    if (interval == 0) {
      return StreamError::ZERO_INTERVAL;
    }
    struct State {
      Stream<T> source;
      Action action;
      size_t countdown;
    };
    auto state = std::make_shared<State>(
        State{std::move(source), std::move(action), interval});
    return Stream<T>{
        [state, interval]() -> outcome::result<std::optional<T>> {
          OUTCOME_TRY(item, state->source.next());
          if (item.has_value() and --state->countdown == 0) {
            state->countdown = interval;
            OUTCOME_TRY(state->action(*item));
          }
          return item;
        }};
  }

}  // namespace ratemon::stream
