/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "log/logger.hpp"
#include "rate/logger_details.hpp"

namespace ratemon::rate {

  enum class RateLoggerError : uint8_t {
    COUNTER_REJECTED_DELTA = 1,
    UNKNOWN_TAG,
    DUPLICATE_TAG,
  };

  /**
   * Converts the number of events observed during one sampling interval into
   * a per second rate, updates the configured metrics with it and writes it to
   * the log.
   */
  class RateLogger {
   public:
    explicit RateLogger(LoggerDetails details);

    /**
     * @brief applies one sampling tick
     * @param sample number of events since the previous tick
     * Every configured metric is updated even if some counter refuses its
     * delta. Such a refusal is an error only under RejectedDeltaPolicy::FAIL.
     */
    outcome::result<void> log(uint64_t sample) const;

    /**
     * @return the rate `log` writes for `sample`, none if logging is disabled
     */
    std::optional<double> loggedRate(uint64_t sample) const;

    const LoggerDetails &details() const {
      return details_;
    }

    static std::string formatMessage(const LoggerDetails &details,
                                     double rate);

   private:
    /// @return false if the metric refused the value
    bool update(const MetricHandle &metric,
                const UpdateFn &fn,
                double sample) const;

    LoggerDetails details_;
    log::Logger logger_;
  };

}  // namespace ratemon::rate

OUTCOME_HPP_DECLARE_ERROR(ratemon::rate, RateLoggerError);
