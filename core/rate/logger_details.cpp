/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rate/logger_details.hpp"

#include <algorithm>
#include <cmath>

OUTCOME_CPP_DEFINE_CATEGORY(ratemon::rate, LoggerDetailsError, e) {
  using E = ratemon::rate::LoggerDetailsError;
  switch (e) {
    case E::NON_POSITIVE_INTERVAL:
      return "Sampling interval must be a positive number of seconds";
    case E::INTERVAL_TOO_LARGE:
      return "Sampling interval exceeds the range of the clock";
    case E::NULL_METRIC_HANDLE:
      return "Metric handle is null";
  }
  return "Unknown rate::LoggerDetailsError";
}

namespace ratemon::rate {

  LoggerDetailsBuilder &LoggerDetailsBuilder::label(std::string label) {
    label_ = std::move(label);
    return *this;
  }

  LoggerDetailsBuilder &LoggerDetailsBuilder::tag(std::string tag) {
    tag_ = std::move(tag);
    return *this;
  }

  LoggerDetailsBuilder &LoggerDetailsBuilder::unit(std::string unit) {
    unit_ = std::move(unit);
    return *this;
  }

  LoggerDetailsBuilder &LoggerDetailsBuilder::action(std::string action) {
    action_ = std::move(action);
    return *this;
  }

  LoggerDetailsBuilder &LoggerDetailsBuilder::intervalSecs(
      double interval_secs) {
    interval_secs_ = interval_secs;
    return *this;
  }

  LoggerDetailsBuilder &LoggerDetailsBuilder::log(bool should_log,
                                                  UpdateFn update) {
    should_log_ = should_log;
    log_update_ = std::move(update);
    return *this;
  }

  LoggerDetailsBuilder &LoggerDetailsBuilder::counter(
      metrics::Counter *counter, UpdateFn update) {
    metrics_.counters.emplace_back(counter, std::move(update));
    return *this;
  }

  LoggerDetailsBuilder &LoggerDetailsBuilder::gauge(metrics::Gauge *gauge,
                                                    UpdateFn update) {
    metrics_.gauges.emplace_back(gauge, std::move(update));
    return *this;
  }

  LoggerDetailsBuilder &LoggerDetailsBuilder::metrics(MetricDetails metrics) {
    metrics_ = std::move(metrics);
    return *this;
  }

  LoggerDetailsBuilder &LoggerDetailsBuilder::rejectedDeltaPolicy(
      RejectedDeltaPolicy policy) {
    rejected_delta_policy_ = policy;
    return *this;
  }

  outcome::result<LoggerDetails> LoggerDetailsBuilder::build() const {
    if (not std::isfinite(interval_secs_) or interval_secs_ <= 0.0) {
      return LoggerDetailsError::NON_POSITIVE_INTERVAL;
    }
    if (interval_secs_ > kMaxIntervalSecs) {
      return LoggerDetailsError::INTERVAL_TOO_LARGE;
    }
    auto is_null = [](const auto &entry) { return entry.first == nullptr; };
    if (std::ranges::any_of(metrics_.counters, is_null)
        or std::ranges::any_of(metrics_.gauges, is_null)) {
      return LoggerDetailsError::NULL_METRIC_HANDLE;
    }

    LoggerDetails details;
    details.label_ = label_;
    details.tag_ = tag_;
    details.unit_ = unit_;
    details.action_ = action_;
    details.interval_secs_ = interval_secs_;
    details.should_log_ = should_log_;
    details.log_update_ = log_update_;
    details.metrics_ = metrics_;
    details.rejected_delta_policy_ = rejected_delta_policy_;
    return details;
  }

}  // namespace ratemon::rate
