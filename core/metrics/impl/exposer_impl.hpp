/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <thread>

#include <boost/asio/io_context.hpp>

#include "log/logger.hpp"
#include "metrics/exposer.hpp"
#include "metrics/session.hpp"

namespace ratemon::metrics {

  /// Exposer running its own io_context on one background thread
  class ExposerImpl final : public Exposer,
                            public std::enable_shared_from_this<ExposerImpl> {
    using Acceptor = boost::asio::ip::tcp::acceptor;

   public:
    ExposerImpl(Configuration config, Session::Configuration session_config);

    ~ExposerImpl() override;

    outcome::result<void> prepare() override;
    outcome::result<void> start() override;
    void stop() override;

    uint16_t port() const override;

   private:
    void acceptNext();

    const Configuration config_;
    const Session::Configuration session_config_;

    std::shared_ptr<Session::Context> context_;
    std::optional<Acceptor> acceptor_;
    std::thread thread_;

    log::Logger logger_;
  };

}  // namespace ratemon::metrics
