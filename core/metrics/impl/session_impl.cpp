/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/session_impl.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

namespace ratemon::metrics {

  namespace http = boost::beast::http;

  SessionImpl::SessionImpl(Context &context,
                           Configuration config,
                           RequestHandler on_request)
      : strand_(boost::asio::make_strand(context)),
        config_{config},
        on_request_{std::move(on_request)},
        stream_(Socket(strand_)),
        logger_{log::createLogger("OpenMetricsSession", "metrics")} {}

  void SessionImpl::start() {
    boost::asio::dispatch(strand_,
                          [self = shared_from_this()] { self->readRequest(); });
  }

  void SessionImpl::readRequest() {
    parser_.emplace();
    parser_->body_limit(config_.max_request_size);
    stream_.expires_after(config_.operation_timeout);

    http::async_read(stream_,
                     buffer_,
                     *parser_,
                     boost::beast::bind_front_handler(
                         &SessionImpl::onRequestRead, shared_from_this()));
  }

  void SessionImpl::onRequestRead(boost::system::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      return close();
    }
    if (ec) {
      SL_DEBUG(logger_, "Reading request failed: {}", ec.message());
      return close();
    }
    on_request_(parser_->release(), shared_from_this());
  }

  void SessionImpl::respond(Response response) {
    response_ = std::make_unique<Response>(std::move(response));
    stream_.expires_after(config_.operation_timeout);

    http::async_write(stream_,
                      *response_,
                      boost::beast::bind_front_handler(
                          &SessionImpl::onResponseWritten,
                          shared_from_this(),
                          response_->need_eof()));
  }

  void SessionImpl::onResponseWritten(bool close_after,
                                      boost::system::error_code ec,
                                      std::size_t) {
    response_.reset();
    if (ec) {
      SL_DEBUG(logger_, "Writing response failed: {}", ec.message());
      return close();
    }
    if (close_after) {
      return close();
    }
    readRequest();
  }

  void SessionImpl::close() {
    boost::system::error_code ec;
    stream_.socket().shutdown(Socket::shutdown_send, ec);
    if (ec and ec != boost::asio::error::not_connected) {
      SL_DEBUG(logger_, "Shutdown of connection failed: {}", ec.message());
    }
  }

}  // namespace ratemon::metrics
