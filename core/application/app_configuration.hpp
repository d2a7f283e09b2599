/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>

namespace ratemon::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return logging tuning directives (`level` or `group=level`)
     */
    virtual const std::vector<std::string> &log() const = 0;

    /**
     * @return endpoint for OpenMetrics over HTTP, or nothing when the
     * exposer is disabled
     */
    virtual std::optional<boost::asio::ip::tcp::endpoint>
    openmetricsHttpEndpoint() const = 0;

    /**
     * @return sampling interval of the rate logger in seconds
     */
    virtual double rateIntervalSecs() const = 0;

    /**
     * @return number of pipeline elements between two rate samples
     */
    virtual uint32_t tickEvery() const = 0;

    /**
     * @return number of synthetic events to emit, zero means unbounded
     */
    virtual uint64_t eventsLimit() const = 0;
  };

}  // namespace ratemon::application
