/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <concepts>
#include <string>

#include "clock/clock.hpp"
#include "rate/rate_logger.hpp"
#include "rate/rate_logger_registry.hpp"
#include "stream/stream.hpp"

namespace ratemon::stream {

  /**
   * @brief counts the elements passing through and hands the count to
   * `logger` once per sampling interval of the logger
   *
   * Ticks are due at whole intervals after the first pull. Elapsed ticks are
   * sampled on every pull before the new element is counted, so a reported
   * count always belongs to one interval. When several intervals passed
   * without a pull, the idle span after the first of them is reported once
   * as zero.
   *
   * When the source is over the stream keeps ticking: every pull sleeps on
   * `steady_clock` until the next tick, reports the count and yields a
   * default constructed element. So the result never ends, even for a finite
   * source.
   */
  template <typename T>
    requires std::default_initializable<T>
  Stream<T> withRateGauge(
      std::shared_ptr<const rate::RateLogger> logger,
      std::shared_ptr<const clock::SteadyClock> steady_clock,
      Stream<T> source) {
    using Duration = clock::SteadyClock::Duration;
    using TimePoint = clock::SteadyClock::TimePoint;

    struct State {
      Stream<T> source;
      std::shared_ptr<const rate::RateLogger> logger;
      std::shared_ptr<const clock::SteadyClock> clock;
      Duration interval;
      std::optional<TimePoint> last_tick{};
      uint64_t count = 0;
      bool exhausted = false;
    };

    auto interval = std::chrono::duration_cast<Duration>(
        std::chrono::duration<double>(logger->details().intervalSecs()));
    auto state = std::make_shared<State>(State{std::move(source),
                                               std::move(logger),
                                               std::move(steady_clock),
                                               interval});

    // samples the ticks elapsed by `now`, if any
    auto sample = [](State &s, TimePoint now) -> outcome::result<void> {
      auto ticks = (now - *s.last_tick) / s.interval;
      if (ticks < 1) {
        return outcome::success();
      }
      OUTCOME_TRY(s.logger->log(std::exchange(s.count, 0)));
      if (ticks > 1) {
        OUTCOME_TRY(s.logger->log(0));
      }
      *s.last_tick += ticks * s.interval;
      return outcome::success();
    };

    return Stream<T>{[state, sample]() -> outcome::result<std::optional<T>> {
      if (not state->last_tick.has_value()) {
        state->last_tick = state->clock->now();
      }

      if (not state->exhausted) {
        OUTCOME_TRY(item, state->source.next());
        if (item.has_value()) {
          OUTCOME_TRY(sample(*state, state->clock->now()));
          ++state->count;
          return item;
        }
        state->exhausted = true;
      }

      auto due = *state->last_tick + state->interval;
      auto now = state->clock->now();
      if (now < due) {
        state->clock->sleepUntil(due);
        now = due;
      }
      OUTCOME_TRY(sample(*state, now));
      return std::optional<T>{std::in_place};
    }};
  }

  /**
   * @brief withRateGauge over a finite-aware source: same elements as
   * `source`, and ends when `source` ends
   *
   * Elements are wrapped, followed by one empty sentinel, and unwrapped again
   * up to the sentinel.
   */
  template <typename T>
  Stream<T> finiteWithRateGauge(
      std::shared_ptr<const rate::RateLogger> logger,
      std::shared_ptr<const clock::SteadyClock> steady_clock,
      Stream<T> source) {
    auto wrapped = concat(map(std::move(source),
                              [](T value) {
                                return std::optional<T>{std::in_place,
                                                        std::move(value)};
                              }),
                          once(std::optional<T>{}));
    auto gauged = withRateGauge(
        std::move(logger), std::move(steady_clock), std::move(wrapped));
    return catOptionals(
        takeWhile(std::move(gauged), [](const std::optional<T> &value) {
          return value.has_value();
        }));
  }

  /**
   * @brief finiteWithRateGauge with the rate logger configured for `tag`
   * @return RateLoggerError::UNKNOWN_TAG if there is none
   */
  template <typename T>
  outcome::result<Stream<T>> finiteWithRateGauge(
      const rate::RateLoggerRegistry &loggers,
      const std::string &tag,
      std::shared_ptr<const clock::SteadyClock> steady_clock,
      Stream<T> source) {
    OUTCOME_TRY(logger, loggers.get(tag));
    return finiteWithRateGauge(
        std::move(logger), std::move(steady_clock), std::move(source));
  }

}  // namespace ratemon::stream
