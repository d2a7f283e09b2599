/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <prometheus/collectable.h>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/registry.h>
#include <prometheus/summary.h>

#include "log/logger.hpp"
#include "metrics/handler.hpp"

namespace ratemon::metrics {

  /**
   * Serves every registered collectable in the Prometheus text format on its
   * path and on the root path, and accounts its own scrapes.
   */
  class PrometheusHandler : public Handler {
   public:
    static constexpr std::string_view kDefaultPath = "/metrics";

    explicit PrometheusHandler(std::string path = std::string{kDefaultPath});
    ~PrometheusHandler() override = default;

    void registerCollectable(Registry &registry) override;

    void onSessionRequest(Session::Request request,
                          std::shared_ptr<Session> session) override;

    const std::string &path() const {
      return path_;
    }

   private:
    void registerCollectable(
        const std::weak_ptr<prometheus::Collectable> &collectable);
    static void cleanupStalePointers(
        std::vector<std::weak_ptr<prometheus::Collectable>> &collectables);
    std::size_t writeResponse(const std::shared_ptr<Session> &session,
                              const Session::Request &request,
                              boost::beast::http::status status,
                              std::string body);

    const std::string path_;

    std::mutex collectables_mutex_;
    std::vector<std::weak_ptr<prometheus::Collectable>> collectables_;

    std::shared_ptr<prometheus::Registry> registry_;
    prometheus::Counter &bytes_transferred_;
    prometheus::Counter &num_scrapes_;
    prometheus::Summary &request_latencies_;

    log::Logger logger_;
  };

}  // namespace ratemon::metrics
