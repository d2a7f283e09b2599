/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/metrics_server.hpp"

#include "log/logger.hpp"
#include "metrics/impl/exposer_impl.hpp"
#include "metrics/impl/prometheus/handler_impl.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ratemon::metrics, ServerError, e) {
  using E = ratemon::metrics::ServerError;
  switch (e) {
    case E::PREPARE_FAILED:
      return "Metrics server cannot listen on the configured endpoint";
    case E::START_FAILED:
      return "Metrics server cannot start";
  }
  return "Unknown metrics::ServerError";
}

namespace ratemon::metrics {

  outcome::result<std::shared_ptr<Exposer>> initMetricsServer(
      const Exposer::Configuration &config,
      Registry &registry,
      Session::Configuration session_config) {
    auto logger = log::createLogger("MetricsServer", "metrics");

    auto handler = std::make_shared<PrometheusHandler>();
    registry.setHandler(*handler);

    auto exposer = std::make_shared<ExposerImpl>(config, session_config);
    exposer->setHandler(handler);

    if (auto res = exposer->prepare(); res.has_error()) {
      SL_CRITICAL(logger,
                  "Cannot serve metrics on {}:{}: {}",
                  config.endpoint.address().to_string(),
                  config.endpoint.port(),
                  res.error().message());
      return ServerError::PREPARE_FAILED;
    }

    SL_INFO(logger,
            "Starting metrics server at http://localhost:{}/",
            exposer->port());

    if (auto res = exposer->start(); res.has_error()) {
      SL_CRITICAL(
          logger, "Cannot start metrics server: {}", res.error().message());
      return ServerError::START_FAILED;
    }
    return exposer;
  }

  outcome::result<std::shared_ptr<Exposer>> initMetricsServer(
      uint16_t port, Registry &registry) {
    Exposer::Configuration config;
    config.endpoint.port(port);
    return initMetricsServer(config, registry);
  }

}  // namespace ratemon::metrics
