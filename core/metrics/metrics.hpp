/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "metrics/registry.hpp"

namespace ratemon::metrics {
  using RegistryPtr = std::unique_ptr<Registry>;

  // the function recommended to use to create a registry of the chosen
  // implementation
  RegistryPtr createRegistry();

  /**
   * @brief A counter metric to represent a monotonically increasing value.
   *
   * This class represents the metric type counter:
   * https://prometheus.io/docs/concepts/metric_types/#counter
   */
  class Counter {
   public:
    virtual ~Counter() = default;

    /**
     * @brief Increment the counter by 1.
     */
    virtual void inc() = 0;

    /**
     * @brief Increment the counter by the given amount.
     * @return false if the amount is negative, the counter is not changed then
     */
    virtual bool add(double val) = 0;

    /**
     * @brief Current value of the counter.
     */
    virtual double value() const = 0;
  };

  /**
   * @brief A gauge metric to represent a value that can arbitrarily go up and
   * down.
   *
   * The class represents the metric type gauge:
   * https://prometheus.io/docs/concepts/metric_types/#gauge
   */
  class Gauge {
   public:
    virtual ~Gauge() = default;

    /**
     * @brief Increment the gauge by 1.
     */
    virtual void inc() = 0;

    /**
     * @brief Increment the gauge by the given amount.
     */
    virtual void inc(double val) = 0;

    /**
     * @brief Decrement the gauge by 1.
     */
    virtual void dec() = 0;

    /**
     * @brief Decrement the gauge by the given amount.
     */
    virtual void dec(double val) = 0;

    /**
     * @brief Set the gauge to the given value.
     */
    virtual void set(double val) = 0;

    /**
     * @brief Current value of the gauge.
     */
    virtual double value() const = 0;
  };

  /**
   * @brief A family of same-named metrics distinguished by the values of a
   * fixed list of labels.
   */
  template <typename Metric>
  class Vector {
   public:
    using LabelValues = std::vector<std::string>;

    virtual ~Vector() = default;

    virtual const std::vector<std::string> &labelNames() const = 0;

    /**
     * @brief the metric of the given label values, created on first use
     * @param values one value per label name, in the order of labelNames()
     * @return pointer without ownership
     */
    virtual outcome::result<Metric *> withLabels(
        const LabelValues &values) = 0;

    /**
     * @brief drops the metric of the given label values, if any
     * Pointers returned by withLabels() for these values become dangling.
     */
    virtual void remove(const LabelValues &values) = 0;

    /**
     * @brief drops every metric of the vector
     */
    virtual void clear() = 0;

    /**
     * @brief current values of every metric of the vector
     */
    virtual std::vector<std::pair<LabelValues, double>> collect() const = 0;
  };

  /**
   * @brief registers a counter family and its only unlabeled counter
   */
  inline outcome::result<Counter *> makeCounter(Registry &registry,
                                                const std::string &name,
                                                const std::string &help) {
    OUTCOME_TRY(registry.registerCounterFamily(name, help));
    return registry.registerCounterMetric(name);
  }

  /**
   * @brief registers a gauge family and its only unlabeled gauge
   */
  inline outcome::result<Gauge *> makeGauge(Registry &registry,
                                            const std::string &name,
                                            const std::string &help) {
    OUTCOME_TRY(registry.registerGaugeFamily(name, help));
    return registry.registerGaugeMetric(name);
  }
}  // namespace ratemon::metrics
