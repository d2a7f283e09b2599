/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "outcome/outcome.hpp"

namespace ratemon::metrics {
  class Counter;
  class Gauge;
}  // namespace ratemon::metrics

namespace ratemon::rate {

  /// Transforms a sample before it is used, an empty function is identity
  using UpdateFn = std::function<double(double)>;

  inline double applyUpdate(const UpdateFn &fn, double value) {
    return fn ? fn(value) : value;
  }

  /// Metric updated on a sampling tick, dispatched by kind
  using MetricHandle = std::variant<metrics::Counter *, metrics::Gauge *>;

  /**
   * Metrics updated on every sampling tick. Counters are incremented by the
   * (updated) sample, gauges are set to the (updated) sample per second.
   */
  struct MetricDetails {
    std::vector<std::pair<metrics::Counter *, UpdateFn>> counters;
    std::vector<std::pair<metrics::Gauge *, UpdateFn>> gauges;
  };

  /// What to do when a counter refuses a negative delta
  enum class RejectedDeltaPolicy : uint8_t {
    IGNORE,
    WARN,
    FAIL,
  };

  /// Longest sampling interval, well inside the range of steady_clock
  constexpr double kMaxIntervalSecs = 1e9;

  enum class LoggerDetailsError : uint8_t {
    NON_POSITIVE_INTERVAL = 1,
    INTERVAL_TOO_LARGE,
    NULL_METRIC_HANDLE,
  };

  class LoggerDetailsBuilder;

  /**
   * Immutable configuration of one rate logging site. Only a
   * LoggerDetailsBuilder creates it, so the interval is always positive.
   */
  class LoggerDetails {
   public:
    /// logger tag the rate line is emitted with
    const std::string &label() const {
      return label_;
    }
    const std::string &tag() const {
      return tag_;
    }
    const std::string &unit() const {
      return unit_;
    }
    const std::string &action() const {
      return action_;
    }
    /// sampling interval, the denominator of every rate
    double intervalSecs() const {
      return interval_secs_;
    }
    bool shouldLog() const {
      return should_log_;
    }
    const UpdateFn &logUpdate() const {
      return log_update_;
    }
    const MetricDetails &metrics() const {
      return metrics_;
    }
    RejectedDeltaPolicy rejectedDeltaPolicy() const {
      return rejected_delta_policy_;
    }

   private:
    friend class LoggerDetailsBuilder;
    LoggerDetails() = default;

    std::string label_;
    std::string tag_;
    std::string unit_;
    std::string action_;
    double interval_secs_{};
    bool should_log_{};
    UpdateFn log_update_;
    MetricDetails metrics_;
    RejectedDeltaPolicy rejected_delta_policy_{};
  };

  /**
   * Starts from the default details: label `defaultLabel`, tag `defaultTag`,
   * unit `defaultUnit`, action `defaultAction`, one second interval, logging
   * enabled, no metrics, rejected deltas reported as warnings.
   */
  class LoggerDetailsBuilder {
   public:
    LoggerDetailsBuilder &label(std::string label);
    LoggerDetailsBuilder &tag(std::string tag);
    LoggerDetailsBuilder &unit(std::string unit);
    LoggerDetailsBuilder &action(std::string action);
    LoggerDetailsBuilder &intervalSecs(double interval_secs);
    LoggerDetailsBuilder &log(bool should_log, UpdateFn update = {});
    LoggerDetailsBuilder &counter(metrics::Counter *counter,
                                  UpdateFn update = {});
    LoggerDetailsBuilder &gauge(metrics::Gauge *gauge, UpdateFn update = {});
    LoggerDetailsBuilder &metrics(MetricDetails metrics);
    LoggerDetailsBuilder &rejectedDeltaPolicy(RejectedDeltaPolicy policy);

    /**
     * @return the details, or an error if the interval is not a positive
     * finite number or a metric handle is null
     */
    outcome::result<LoggerDetails> build() const;

   private:
    std::string label_{"defaultLabel"};
    std::string tag_{"defaultTag"};
    std::string unit_{"defaultUnit"};
    std::string action_{"defaultAction"};
    double interval_secs_{1.0};
    bool should_log_{true};
    UpdateFn log_update_;
    MetricDetails metrics_;
    RejectedDeltaPolicy rejected_delta_policy_{RejectedDeltaPolicy::WARN};
  };

}  // namespace ratemon::rate

OUTCOME_HPP_DECLARE_ERROR(ratemon::rate, LoggerDetailsError);
