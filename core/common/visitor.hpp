/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <utility>
#include <variant>

namespace ratemon {

  /// Overload set built from lambdas, one alternative per lambda
  template <typename... Fs>
  struct Overloaded : Fs... {
    using Fs::operator()...;
  };

  template <typename... Fs>
  Overloaded(Fs...) -> Overloaded<Fs...>;

  /**
   * @brief visits `variant` with the lambda accepting the held alternative
   * @code
   *   visit_in_place(metric,
   *                  [](metrics::Counter *counter) { counter->inc(); },
   *                  [](metrics::Gauge *gauge) { gauge->set(0); });
   * @endcode
   */
  template <typename Variant, typename... Fs>
  constexpr decltype(auto) visit_in_place(Variant &&variant, Fs &&...fs) {
    return std::visit(Overloaded{std::forward<Fs>(fs)...},
                      std::forward<Variant>(variant));
  }

}  // namespace ratemon
