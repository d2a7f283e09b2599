/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "metrics/exposer.hpp"
#include "metrics/registry.hpp"
#include "metrics/session.hpp"
#include "outcome/outcome.hpp"

namespace ratemon::metrics {

  enum class ServerError : uint8_t {
    PREPARE_FAILED = 1,
    START_FAILED,
  };

  /**
   * @brief starts serving `registry` over HTTP on a background thread
   * The returned exposer keeps running until stopped or destroyed.
   */
  outcome::result<std::shared_ptr<Exposer>> initMetricsServer(
      const Exposer::Configuration &config,
      Registry &registry,
      Session::Configuration session_config = {});

  /**
   * @brief same, listening on every interface on `port`
   */
  outcome::result<std::shared_ptr<Exposer>> initMetricsServer(
      uint16_t port, Registry &registry);

}  // namespace ratemon::metrics

OUTCOME_HPP_DECLARE_ERROR(ratemon::metrics, ServerError);
