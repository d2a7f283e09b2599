/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace ratemon::metrics {

  /**
   * @brief one HTTP/1.1 connection of the scrape endpoint
   * Requests are read one at a time; the next one is read after the response
   * to the previous one is written.
   */
  class Session {
   public:
    using Body = boost::beast::http::string_body;
    using Request = boost::beast::http::request<Body>;
    using Response = boost::beast::http::response<Body>;
    using Context = boost::asio::io_context;
    using Socket = boost::asio::ip::tcp::socket;
    using Duration = boost::asio::steady_timer::duration;

    /// Called for every request read; must eventually call respond()
    using RequestHandler =
        std::function<void(Request, std::shared_ptr<Session>)>;

    struct Configuration {
      static constexpr size_t kDefaultRequestSize = 10000u;
      static constexpr Duration kDefaultTimeout = std::chrono::seconds(30);

      /// limit of a request body, larger requests drop the connection
      size_t max_request_size{kDefaultRequestSize};
      /// limit of reading a request or writing a response
      Duration operation_timeout{kDefaultTimeout};
    };

    virtual ~Session() = default;

    virtual Socket &socket() = 0;

    /// Starts reading requests from an accepted socket
    virtual void start() = 0;

    virtual void respond(Response response) = 0;
  };

}  // namespace ratemon::metrics
