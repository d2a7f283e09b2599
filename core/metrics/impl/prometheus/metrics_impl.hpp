/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>
#include <stdexcept>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>

#include "metrics/metrics.hpp"

namespace ratemon::metrics {

  class PrometheusCounter : public Counter {
   public:
    explicit PrometheusCounter(prometheus::Counter &m) : m_(m) {}

    void inc() override {
      m_.Increment();
    }

    bool add(double val) override {
      // also rejects NaN
      if (not(val >= 0.0)) {
        return false;
      }
      m_.Increment(val);
      return true;
    }

    double value() const override {
      return m_.Value();
    }

    prometheus::Counter &internal() {
      return m_;
    }

   private:
    prometheus::Counter &m_;
  };

  class PrometheusGauge : public Gauge {
   public:
    explicit PrometheusGauge(prometheus::Gauge &m) : m_(m) {}

    void inc() override {
      m_.Increment();
    }

    void inc(double val) override {
      m_.Increment(val);
    }

    void dec() override {
      m_.Decrement();
    }

    void dec(double val) override {
      m_.Decrement(val);
    }

    void set(double val) override {
      m_.Set(val);
    }

    double value() const override {
      return m_.Value();
    }

    prometheus::Gauge &internal() {
      return m_;
    }

   private:
    prometheus::Gauge &m_;
  };

  template <typename T>
  struct PrometheusTraits;

  template <>
  struct PrometheusTraits<prometheus::Counter> {
    using Interface = Counter;
    using Wrapper = PrometheusCounter;
    static auto build() {
      return prometheus::BuildCounter();
    }
  };

  template <>
  struct PrometheusTraits<prometheus::Gauge> {
    using Interface = Gauge;
    using Wrapper = PrometheusGauge;
    static auto build() {
      return prometheus::BuildGauge();
    }
  };

  /**
   * Labeled metrics of one prometheus family. Children are created on first
   * use and owned by the vector, which is the only wrapper of the family.
   */
  template <typename T>
  class PrometheusVector final
      : public Vector<typename PrometheusTraits<T>::Interface> {
    using Interface = typename PrometheusTraits<T>::Interface;
    using Wrapper = typename PrometheusTraits<T>::Wrapper;
    using LabelValues = typename Vector<Interface>::LabelValues;

   public:
    PrometheusVector(prometheus::Family<T> &family,
                     std::vector<std::string> label_names)
        : family_{family}, label_names_{std::move(label_names)} {}

    const std::vector<std::string> &labelNames() const override {
      return label_names_;
    }

    outcome::result<Interface *> withLabels(
        const LabelValues &values) override {
      if (values.size() != label_names_.size()) {
        return RegistryError::LABEL_ARITY_MISMATCH;
      }
      std::lock_guard lock{mutex_};
      if (auto it = children_.find(values); it != children_.end()) {
        return static_cast<Interface *>(it->second.get());
      }
      std::map<std::string, std::string> labels;
      for (size_t i = 0; i < values.size(); ++i) {
        labels.emplace(label_names_[i], values[i]);
      }
      try {
        auto &metric = family_.Add(labels);
        auto [it, _] =
            children_.emplace(values, std::make_unique<Wrapper>(metric));
        return static_cast<Interface *>(it->second.get());
      } catch (const std::invalid_argument &) {
        return RegistryError::INVALID_LABELS;
      }
    }

    void remove(const LabelValues &values) override {
      std::lock_guard lock{mutex_};
      auto it = children_.find(values);
      if (it == children_.end()) {
        return;
      }
      family_.Remove(&it->second->internal());
      children_.erase(it);
    }

    void clear() override {
      std::lock_guard lock{mutex_};
      for (auto &[_, child] : children_) {
        family_.Remove(&child->internal());
      }
      children_.clear();
    }

    std::vector<std::pair<LabelValues, double>> collect() const override {
      std::lock_guard lock{mutex_};
      std::vector<std::pair<LabelValues, double>> result;
      result.reserve(children_.size());
      for (auto &[values, child] : children_) {
        result.emplace_back(values, child->value());
      }
      return result;
    }

   private:
    prometheus::Family<T> &family_;
    const std::vector<std::string> label_names_;

    mutable std::mutex mutex_;
    std::map<LabelValues, std::unique_ptr<Wrapper>> children_;
  };

  using PrometheusCounterVector = PrometheusVector<prometheus::Counter>;
  using PrometheusGaugeVector = PrometheusVector<prometheus::Gauge>;

}  // namespace ratemon::metrics
