/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

#include <prometheus/registry.h>

#include "metrics/impl/prometheus/metrics_impl.hpp"
#include "metrics/registry.hpp"

namespace ratemon::metrics {

  /**
   * Facade over the process-wide prometheus registry. The families, metric
   * wrappers and vectors are process-wide as well, so every facade hands out
   * the same object for the same metric. A family name belongs either to
   * plain metrics or to one vector, never to both.
   */
  class PrometheusRegistry : public Registry {
   public:
    PrometheusRegistry() = default;
    ~PrometheusRegistry() override = default;

    /**
     * @brief prometheus registry shared by all facades
     */
    static std::shared_ptr<prometheus::Registry> internalRegistry();

    void setHandler(Handler &handler) override;

    outcome::result<void> registerCounterFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    outcome::result<void> registerGaugeFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    outcome::result<Counter *> registerCounterMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels) override;

    outcome::result<Gauge *> registerGaugeMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels) override;

    outcome::result<CounterVector *> registerCounterVector(
        const std::string &name,
        const std::string &help,
        const std::vector<std::string> &label_names) override;

    outcome::result<GaugeVector *> registerGaugeVector(
        const std::string &name,
        const std::string &help,
        const std::vector<std::string> &label_names) override;

   private:
    template <typename T>
    using Families =
        std::unordered_map<std::string, prometheus::Family<T> *>;

    template <typename T>
    using Metrics = std::unordered_map<
        T *,
        std::unique_ptr<typename PrometheusTraits<T>::Wrapper>>;

    template <typename T>
    using Vectors =
        std::unordered_map<std::string,
                           std::unique_ptr<PrometheusVector<T>>>;

    template <typename T>
    struct Storage {
      // families of plain metrics only, vectors keep their own family
      Families<T> families;
      Metrics<T> metrics;
      Vectors<T> vectors;
    };

    struct SharedState {
      std::mutex mutex;
      Storage<prometheus::Counter> counters;
      Storage<prometheus::Gauge> gauges;
    };

    static SharedState &sharedState();

    template <typename T>
    static Storage<T> &storage(SharedState &state);

    template <typename T>
    static outcome::result<prometheus::Family<T> *> buildFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels);

    template <typename T>
    outcome::result<void> registerFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels);

    template <typename T>
    outcome::result<typename PrometheusTraits<T>::Interface *> registerMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels);

    template <typename T>
    outcome::result<Vector<typename PrometheusTraits<T>::Interface> *>
    registerVector(const std::string &name,
                   const std::string &help,
                   const std::vector<std::string> &label_names);
  };

}  // namespace ratemon::metrics
