/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/exposer_impl.hpp"

#include <soralog/util.hpp>

#include "metrics/impl/session_impl.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ratemon::metrics, ExposerError, e) {
  using E = ratemon::metrics::ExposerError;
  switch (e) {
    case E::NOT_PREPARED:
      return "Exposer is started before its listener was bound";
    case E::NO_HANDLER:
      return "Exposer is started without a request handler";
  }
  return "Unknown metrics::ExposerError";
}

namespace ratemon::metrics {

  namespace {
    std::error_code toStd(const boost::system::error_code &ec) {
      return static_cast<std::error_code>(ec);
    }
  }  // namespace

  ExposerImpl::ExposerImpl(Configuration config,
                           Session::Configuration session_config)
      : config_{std::move(config)},
        session_config_{session_config},
        context_{std::make_shared<Session::Context>()},
        logger_{log::createLogger("OpenMetrics", "metrics")} {}

  ExposerImpl::~ExposerImpl() {
    stop();
  }

  outcome::result<void> ExposerImpl::prepare() {
    auto &acceptor = acceptor_.emplace(*context_);
    boost::system::error_code ec;

    if (acceptor.open(config_.endpoint.protocol(), ec); ec) {
      SL_ERROR(logger_, "Failed to open a listener: {}", ec.message());
      return toStd(ec);
    }
    if (acceptor.set_option(Acceptor::reuse_address(true), ec); ec) {
      SL_ERROR(logger_, "Failed to set reuse_address: {}", ec.message());
      return toStd(ec);
    }
    if (acceptor.bind(config_.endpoint, ec); ec) {
      SL_ERROR(logger_,
               "Failed to bind a listener to {}:{}: {}",
               config_.endpoint.address().to_string(),
               config_.endpoint.port(),
               ec.message());
      return toStd(ec);
    }
    if (acceptor.listen(Acceptor::max_listen_connections, ec); ec) {
      SL_ERROR(logger_, "Failed to listen: {}", ec.message());
      return toStd(ec);
    }
    return outcome::success();
  }

  outcome::result<void> ExposerImpl::start() {
    if (not acceptor_ or not acceptor_->is_open()) {
      return ExposerError::NOT_PREPARED;
    }
    if (not handler_) {
      return ExposerError::NO_HANDLER;
    }

    SL_DEBUG(logger_,
             "Accepting connections on {}:{}",
             config_.endpoint.address().to_string(),
             port());
    acceptNext();

    thread_ = std::thread([context = context_] {
      soralog::util::setThreadName("metrics");
      context->run();
    });
    return outcome::success();
  }

  void ExposerImpl::stop() {
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
    }
    context_->stop();
    if (not thread_.joinable()) {
      return;
    }
    // the last owner may be dropped by a handler running on the thread itself
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
    } else {
      thread_.join();
    }
  }

  uint16_t ExposerImpl::port() const {
    if (not acceptor_ or not acceptor_->is_open()) {
      return config_.endpoint.port();
    }
    boost::system::error_code ec;
    auto local = acceptor_->local_endpoint(ec);
    return ec ? config_.endpoint.port() : local.port();
  }

  void ExposerImpl::acceptNext() {
    auto session = std::make_shared<SessionImpl>(
        *context_,
        session_config_,
        [handler = handler_](Session::Request request,
                             std::shared_ptr<Session> from) {
          handler->onSessionRequest(std::move(request), std::move(from));
        });

    acceptor_->async_accept(
        session->socket(),
        [wp = weak_from_this(), session](boost::system::error_code ec) {
          auto self = wp.lock();
          if (not self) {
            return;
          }
          if (not ec) {
            session->start();
          } else if (ec != boost::asio::error::operation_aborted) {
            SL_DEBUG(self->logger_, "Accept failed: {}", ec.message());
          }
          if (self->acceptor_->is_open()) {
            self->acceptNext();
          }
        });
  }

}  // namespace ratemon::metrics
