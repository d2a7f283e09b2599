/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>

#include <boost/asio/strand.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/parser.hpp>

#include "log/logger.hpp"
#include "metrics/session.hpp"

namespace ratemon::metrics {

  class SessionImpl final : public Session,
                            public std::enable_shared_from_this<SessionImpl> {
    using Parser = boost::beast::http::request_parser<Body>;

   public:
    SessionImpl(Context &context,
                Configuration config,
                RequestHandler on_request);

    Socket &socket() override {
      return stream_.socket();
    }

    void start() override;

    void respond(Response response) override;

   private:
    void readRequest();
    void onRequestRead(boost::system::error_code ec, std::size_t);

    void onResponseWritten(bool close_after,
                           boost::system::error_code ec,
                           std::size_t);

    void close();

    // handlers of one connection never run concurrently
    boost::asio::strand<Context::executor_type> strand_;
    const Configuration config_;
    const RequestHandler on_request_;

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::optional<Parser> parser_;

    // owned here until it is written out
    std::unique_ptr<Response> response_;

    log::Logger logger_;
  };

}  // namespace ratemon::metrics
