/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "outcome/outcome.hpp"

namespace ratemon::metrics {

  class Counter;
  class Gauge;
  class Handler;
  template <typename Metric>
  class Vector;

  using CounterVector = Vector<Counter>;
  using GaugeVector = Vector<Gauge>;

  enum class RegistryError : uint8_t {
    INVALID_FAMILY = 1,
    FAMILY_NOT_REGISTERED,
    INVALID_LABELS,
    LABEL_ARITY_MISMATCH,
  };

  /**
   * @brief the class stores metrics, provides interface to create metrics and
   * families of metrics
   * provides interfaces to register families and metrics of metric types:
   * counter, gauge
   * @param name Set the metric name.
   * @param help Set an additional description.
   * @param labels Assign a set of key-value pairs (= labels) to the
   * metric. All these labels are propagated to each time series within the
   * metric.
   */
  class Registry {
   public:
    virtual ~Registry() = default;

    /**
     * @brief makes the metrics of the registry visible to the handler
     */
    virtual void setHandler(Handler &handler) = 0;

    /**
     * @note registering the same name with the same constant labels again
     * returns the existing family, any other reuse of a name fails with
     * RegistryError::INVALID_FAMILY
     */
    virtual outcome::result<void> registerCounterFamily(
        const std::string &name,
        const std::string &help = "",
        const std::map<std::string, std::string> &labels = {}) = 0;

    virtual outcome::result<void> registerGaugeFamily(
        const std::string &name,
        const std::string &help = "",
        const std::map<std::string, std::string> &labels = {}) = 0;

    /**
     * @brief create counter metrics object
     * @param name the name given at call `registerCounterFamily`
     * @return pointer without ownership, valid until the process exits
     */
    virtual outcome::result<Counter *> registerCounterMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels = {}) = 0;

    /**
     * @brief create gauge metrics object
     * @param name the name given at call `registerGaugeFamily`
     * @return pointer without ownership, valid until the process exits
     */
    virtual outcome::result<Gauge *> registerGaugeMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels = {}) = 0;

    /**
     * @brief create a family of counters labeled by `label_names`
     * Every registry returns the same vector for the same name. A name used
     * by a plain family fails with RegistryError::INVALID_FAMILY.
     * @return pointer without ownership, valid until the process exits
     */
    virtual outcome::result<CounterVector *> registerCounterVector(
        const std::string &name,
        const std::string &help,
        const std::vector<std::string> &label_names) = 0;

    virtual outcome::result<GaugeVector *> registerGaugeVector(
        const std::string &name,
        const std::string &help,
        const std::vector<std::string> &label_names) = 0;
  };

}  // namespace ratemon::metrics

OUTCOME_HPP_DECLARE_ERROR(ratemon::metrics, RegistryError);
