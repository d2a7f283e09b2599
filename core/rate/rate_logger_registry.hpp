/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "rate/rate_logger.hpp"

namespace ratemon::rate {

  /**
   * Rate loggers of an application, keyed by the tag streams refer to them
   * with.
   */
  class RateLoggerRegistry {
   public:
    outcome::result<std::shared_ptr<const RateLogger>> add(
        const std::string &tag, LoggerDetails details);

    outcome::result<std::shared_ptr<const RateLogger>> get(
        const std::string &tag) const;

   private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const RateLogger>> loggers_;
  };

}  // namespace ratemon::rate
