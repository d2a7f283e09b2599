/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rate/rate_logger.hpp"

#include <fmt/format.h>

#include "common/visitor.hpp"
#include "metrics/metrics.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ratemon::rate, RateLoggerError, e) {
  using E = ratemon::rate::RateLoggerError;
  switch (e) {
    case E::COUNTER_REJECTED_DELTA:
      return "Counter rejected a negative delta";
    case E::UNKNOWN_TAG:
      return "No rate logger is configured for the tag";
    case E::DUPLICATE_TAG:
      return "A rate logger is already configured for the tag";
  }
  return "Unknown rate::RateLoggerError";
}

namespace ratemon::rate {

  namespace {
    // a whole rate keeps one fractional digit, as in "4.0"
    std::string formatRate(double rate) {
      auto text = fmt::format("{}", rate);
      if (text.find_first_not_of("-0123456789") == std::string::npos) {
        text += ".0";
      }
      return text;
    }
  }  // namespace

  RateLogger::RateLogger(LoggerDetails details)
      : details_{std::move(details)},
        logger_{log::createLogger(details_.label(), "rate")} {}

  outcome::result<void> RateLogger::log(uint64_t sample) const {
    const auto value = static_cast<double>(sample);

    bool rejected = false;
    for (auto &[counter, fn] : details_.metrics().counters) {
      if (not update(counter, fn, value)) {
        rejected = true;
      }
    }
    for (auto &[gauge, fn] : details_.metrics().gauges) {
      if (not update(gauge, fn, value)) {
        rejected = true;
      }
    }

    if (auto rate = loggedRate(sample)) {
      logger_->info("{}", formatMessage(details_, *rate));
    }

    if (rejected
        and details_.rejectedDeltaPolicy() == RejectedDeltaPolicy::FAIL) {
      return RateLoggerError::COUNTER_REJECTED_DELTA;
    }
    return outcome::success();
  }

  std::optional<double> RateLogger::loggedRate(uint64_t sample) const {
    if (not details_.shouldLog()) {
      return std::nullopt;
    }
    return applyUpdate(details_.logUpdate(), static_cast<double>(sample))
         / details_.intervalSecs();
  }

  std::string RateLogger::formatMessage(const LoggerDetails &details,
                                        double rate) {
    return fmt::format("{} {} at the rate of {} {}/sec",
                       details.tag(),
                       details.action(),
                       formatRate(rate),
                       details.unit());
  }

  bool RateLogger::update(const MetricHandle &metric,
                          const UpdateFn &fn,
                          double sample) const {
    const auto value = applyUpdate(fn, sample);
    return visit_in_place(
        metric,
        [&](metrics::Counter *counter) {
          if (counter->add(value)) {
            return true;
          }
          if (details_.rejectedDeltaPolicy() != RejectedDeltaPolicy::IGNORE) {
            SL_WARN(logger_,
                    "Counter of {} refused delta {}",
                    details_.tag(),
                    value);
          }
          return false;
        },
        [&](metrics::Gauge *gauge) {
          gauge->set(value / details_.intervalSecs());
          return true;
        });
  }

}  // namespace ratemon::rate
