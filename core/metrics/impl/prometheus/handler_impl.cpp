/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/handler_impl.hpp"

#include <algorithm>
#include <chrono>

#include <prometheus/text_serializer.h>

#include "metrics/impl/prometheus/registry_impl.hpp"

using prometheus::BuildCounter;
using prometheus::BuildSummary;
using prometheus::Collectable;
using prometheus::MetricFamily;

namespace {
  std::vector<MetricFamily> collectMetrics(
      const std::vector<std::weak_ptr<Collectable>> &collectables) {
    auto collected_metrics = std::vector<MetricFamily>{};

    for (auto &&wcollectable : collectables) {
      auto collectable = wcollectable.lock();
      if (!collectable) {
        continue;
      }

      auto &&metrics = collectable->Collect();
      collected_metrics.insert(collected_metrics.end(),
                               std::make_move_iterator(metrics.begin()),
                               std::make_move_iterator(metrics.end()));
    }

    return collected_metrics;
  }
}  // namespace

namespace ratemon::metrics {

  PrometheusHandler::PrometheusHandler(std::string path)
      : path_{std::move(path)},
        registry_{std::make_shared<prometheus::Registry>()},
        bytes_transferred_(
            BuildCounter()
                .Name("exposer_transferred_bytes_total")
                .Help("Transferred bytes to metrics services")
                .Register(*registry_)
                .Add({})),
        num_scrapes_(BuildCounter()
                         .Name("exposer_scrapes_total")
                         .Help("Number of times metrics were scraped")
                         .Register(*registry_)
                         .Add({})),
        request_latencies_(
            BuildSummary()
                .Name("exposer_request_latencies")
                .Help("Latencies of serving scrape requests, in microseconds")
                .Register(*registry_)
                .Add({},
                     prometheus::Summary::Quantiles{
                         {0.5, 0.05}, {0.9, 0.01}, {0.99, 0.001}})),
        logger_{log::createLogger("PrometheusHandler", "metrics")} {
    registerCollectable(registry_);
  }

  void PrometheusHandler::registerCollectable(Registry &registry) {
    if (dynamic_cast<PrometheusRegistry *>(&registry) == nullptr) {
      SL_ERROR(logger_, "Registry of unknown implementation is not collected");
      return;
    }
    registerCollectable(PrometheusRegistry::internalRegistry());
  }

  void PrometheusHandler::onSessionRequest(Session::Request request,
                                           std::shared_ptr<Session> session) {
    namespace http = boost::beast::http;

    if (request.method() != http::verb::get) {
      writeResponse(
          session, request, http::status::method_not_allowed, "Not allowed\n");
      return;
    }
    std::string_view target{request.target().data(),
                            request.target().size()};
    if (target != path_ and target != "/") {
      SL_DEBUG(logger_, "Unknown target requested: {}", target);
      writeResponse(session, request, http::status::not_found, "Not found\n");
      return;
    }

    auto start_time_of_request = std::chrono::steady_clock::now();

    std::vector<MetricFamily> metrics;
    {
      std::lock_guard lock{collectables_mutex_};
      metrics = collectMetrics(collectables_);
    }

    const prometheus::TextSerializer serializer;
    auto size = writeResponse(
        session, request, http::status::ok, serializer.Serialize(metrics));

    auto stop_time_of_request = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        stop_time_of_request - start_time_of_request);
    request_latencies_.Observe(duration.count());

    bytes_transferred_.Increment(size);
    num_scrapes_.Increment();
  }

  std::size_t PrometheusHandler::writeResponse(
      const std::shared_ptr<Session> &session,
      const Session::Request &request,
      boost::beast::http::status status,
      std::string body) {
    auto size = body.size();
    Session::Response res{status, request.version()};
    res.set(boost::beast::http::field::content_type,
            "text/plain; version=0.0.4; charset=utf-8");
    res.keep_alive(request.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    session->respond(std::move(res));
    return size;
  }

  void PrometheusHandler::registerCollectable(
      const std::weak_ptr<Collectable> &collectable) {
    std::lock_guard lock{collectables_mutex_};
    cleanupStalePointers(collectables_);
    auto locked = collectable.lock();
    auto same_pointer = [&locked](const std::weak_ptr<Collectable> &candidate) {
      return locked == candidate.lock();
    };
    if (std::ranges::any_of(collectables_, same_pointer)) {
      return;
    }
    collectables_.push_back(collectable);
  }

  void PrometheusHandler::cleanupStalePointers(
      std::vector<std::weak_ptr<Collectable>> &collectables) {
    std::erase_if(collectables,
                  [](const std::weak_ptr<Collectable> &candidate) {
                    return candidate.expired();
                  });
  }

}  // namespace ratemon::metrics
