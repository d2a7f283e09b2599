/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/registry_impl.hpp"

#include <stdexcept>

#include "metrics/handler.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ratemon::metrics, RegistryError, e) {
  using E = ratemon::metrics::RegistryError;
  switch (e) {
    case E::INVALID_FAMILY:
      return "Metric family has an invalid name or conflicts with an already "
             "registered one";
    case E::FAMILY_NOT_REGISTERED:
      return "Metric family is not registered";
    case E::INVALID_LABELS:
      return "Labels are invalid or conflict with the constant labels of the "
             "family";
    case E::LABEL_ARITY_MISMATCH:
      return "Number of label values differs from the number of label names";
  }
  return "Unknown metrics::RegistryError";
}

namespace ratemon::metrics {

  RegistryPtr createRegistry() {
    return std::make_unique<PrometheusRegistry>();
  }

  std::shared_ptr<prometheus::Registry> PrometheusRegistry::internalRegistry() {
    static auto registry = std::make_shared<prometheus::Registry>();
    return registry;
  }

  void PrometheusRegistry::setHandler(Handler &handler) {
    handler.registerCollectable(*this);
  }

  PrometheusRegistry::SharedState &PrometheusRegistry::sharedState() {
    static SharedState state;
    return state;
  }

  template <>
  PrometheusRegistry::Storage<prometheus::Counter> &
  PrometheusRegistry::storage<prometheus::Counter>(SharedState &state) {
    return state.counters;
  }

  template <>
  PrometheusRegistry::Storage<prometheus::Gauge> &
  PrometheusRegistry::storage<prometheus::Gauge>(SharedState &state) {
    return state.gauges;
  }

  template <typename T>
  outcome::result<prometheus::Family<T> *> PrometheusRegistry::buildFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    try {
      return &PrometheusTraits<T>::build()
                  .Name(name)
                  .Help(help)
                  .Labels(labels)
                  .Register(*internalRegistry());
    } catch (const std::invalid_argument &) {
      return RegistryError::INVALID_FAMILY;
    }
  }

  template <typename T>
  outcome::result<void> PrometheusRegistry::registerFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    auto &state = sharedState();
    std::lock_guard lock{state.mutex};
    auto &store = storage<T>(state);
    if (store.vectors.contains(name)) {
      return RegistryError::INVALID_FAMILY;
    }
    OUTCOME_TRY(family, buildFamily<T>(name, help, labels));
    store.families[name] = family;
    return outcome::success();
  }

  template <typename T>
  outcome::result<typename PrometheusTraits<T>::Interface *>
  PrometheusRegistry::registerMetric(
      const std::string &name,
      const std::map<std::string, std::string> &labels) {
    using Interface = typename PrometheusTraits<T>::Interface;
    using Wrapper = typename PrometheusTraits<T>::Wrapper;

    auto &state = sharedState();
    std::lock_guard lock{state.mutex};
    auto &store = storage<T>(state);
    if (store.vectors.contains(name)) {
      // children of a vector are reachable through the vector only
      return RegistryError::INVALID_FAMILY;
    }
    auto family_it = store.families.find(name);
    if (family_it == store.families.end()) {
      return RegistryError::FAMILY_NOT_REGISTERED;
    }
    try {
      auto &metric = family_it->second->Add(labels);
      auto it = store.metrics.find(&metric);
      if (it == store.metrics.end()) {
        it = store.metrics.emplace(&metric, std::make_unique<Wrapper>(metric))
                 .first;
      }
      return static_cast<Interface *>(it->second.get());
    } catch (const std::invalid_argument &) {
      return RegistryError::INVALID_LABELS;
    }
  }

  template <typename T>
  outcome::result<Vector<typename PrometheusTraits<T>::Interface> *>
  PrometheusRegistry::registerVector(
      const std::string &name,
      const std::string &help,
      const std::vector<std::string> &label_names) {
    using Interface = typename PrometheusTraits<T>::Interface;

    auto &state = sharedState();
    std::lock_guard lock{state.mutex};
    auto &store = storage<T>(state);
    if (auto it = store.vectors.find(name); it != store.vectors.end()) {
      if (it->second->labelNames() != label_names) {
        return RegistryError::LABEL_ARITY_MISMATCH;
      }
      return static_cast<Vector<Interface> *>(it->second.get());
    }
    if (store.families.contains(name)) {
      return RegistryError::INVALID_FAMILY;
    }
    OUTCOME_TRY(family, buildFamily<T>(name, help, {}));
    auto [it, _] = store.vectors.emplace(
        name, std::make_unique<PrometheusVector<T>>(*family, label_names));
    return static_cast<Vector<Interface> *>(it->second.get());
  }

  outcome::result<void> PrometheusRegistry::registerCounterFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    return registerFamily<prometheus::Counter>(name, help, labels);
  }

  outcome::result<void> PrometheusRegistry::registerGaugeFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    return registerFamily<prometheus::Gauge>(name, help, labels);
  }

  outcome::result<Counter *> PrometheusRegistry::registerCounterMetric(
      const std::string &name,
      const std::map<std::string, std::string> &labels) {
    return registerMetric<prometheus::Counter>(name, labels);
  }

  outcome::result<Gauge *> PrometheusRegistry::registerGaugeMetric(
      const std::string &name,
      const std::map<std::string, std::string> &labels) {
    return registerMetric<prometheus::Gauge>(name, labels);
  }

  outcome::result<CounterVector *> PrometheusRegistry::registerCounterVector(
      const std::string &name,
      const std::string &help,
      const std::vector<std::string> &label_names) {
    return registerVector<prometheus::Counter>(name, help, label_names);
  }

  outcome::result<GaugeVector *> PrometheusRegistry::registerGaugeVector(
      const std::string &name,
      const std::string &help,
      const std::vector<std::string> &label_names) {
    return registerVector<prometheus::Gauge>(name, help, label_names);
  }

}  // namespace ratemon::metrics
