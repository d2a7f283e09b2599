/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "rate/rate_logger_registry.hpp"

namespace ratemon::rate {

  outcome::result<std::shared_ptr<const RateLogger>> RateLoggerRegistry::add(
      const std::string &tag, LoggerDetails details) {
    std::lock_guard lock{mutex_};
    if (loggers_.contains(tag)) {
      return RateLoggerError::DUPLICATE_TAG;
    }
    auto logger = std::make_shared<const RateLogger>(std::move(details));
    loggers_.emplace(tag, logger);
    return logger;
  }

  outcome::result<std::shared_ptr<const RateLogger>> RateLoggerRegistry::get(
      const std::string &tag) const {
    std::lock_guard lock{mutex_};
    auto it = loggers_.find(tag);
    if (it == loggers_.end()) {
      return RateLoggerError::UNKNOWN_TAG;
    }
    return it->second;
  }

}  // namespace ratemon::rate
