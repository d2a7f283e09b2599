/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "metrics/session.hpp"

namespace ratemon::metrics {

  class Registry;

  /// Answers scrape requests with the metrics of the registered registries
  class Handler {
   public:
    virtual ~Handler() = default;

    /// Adds the metrics of `registry` to every following scrape
    virtual void registerCollectable(Registry &registry) = 0;

    virtual void onSessionRequest(Session::Request request,
                                  std::shared_ptr<Session> session) = 0;
  };

}  // namespace ratemon::metrics
