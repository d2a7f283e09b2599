/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <memory>

#include <boost/asio/ip/tcp.hpp>

#include "metrics/handler.hpp"
#include "outcome/outcome.hpp"

namespace ratemon::metrics {

  enum class ExposerError : uint8_t {
    NOT_PREPARED = 1,
    NO_HANDLER,
  };

  /**
   * @brief HTTP server of the scrape endpoint
   * Accepted connections become sessions whose requests go to the handler.
   */
  class Exposer {
   public:
    using Endpoint = boost::asio::ip::tcp::endpoint;

    struct Configuration {
      /// port 0 picks a free port, see port()
      Endpoint endpoint{boost::asio::ip::address_v4::any(), 0};
    };

    virtual ~Exposer() = default;

    void setHandler(std::shared_ptr<Handler> handler) {
      handler_ = std::move(handler);
    }

    /**
     * Binds the listening socket
     * @return error of the socket operation which failed
     */
    virtual outcome::result<void> prepare() = 0;

    /// Serves connections on a background thread, requires prepare() and a
    /// handler
    virtual outcome::result<void> start() = 0;

    /// Closes the listener and joins the background thread
    virtual void stop() = 0;

    /// Bound port after prepare(), the configured one before
    virtual uint16_t port() const = 0;

   protected:
    std::shared_ptr<Handler> handler_;
  };

}  // namespace ratemon::metrics

OUTCOME_HPP_DECLARE_ERROR(ratemon::metrics, ExposerError);
