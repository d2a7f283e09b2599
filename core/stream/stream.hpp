/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "outcome/outcome.hpp"

namespace ratemon::stream {

  /**
   * Pull based stream of values. Each pull yields the next element, none once
   * the stream is over, or the error that failed it. Copies share the
   * position.
   */
  template <typename T>
  class Stream {
   public:
    using ValueType = T;
    using Item = std::optional<T>;
    using Pull = std::function<outcome::result<Item>()>;

    explicit Stream(Pull pull) : pull_{std::move(pull)} {}

    outcome::result<Item> next() {
      return pull_();
    }

   private:
    Pull pull_;
  };

  template <typename T>
  Stream<T> fromVector(std::vector<T> items) {
    struct State {
      std::vector<T> items;
      size_t pos = 0;
    };
    auto state = std::make_shared<State>(State{std::move(items)});
    return Stream<T>{[state]() -> outcome::result<std::optional<T>> {
      if (state->pos == state->items.size()) {
        return std::optional<T>{};
      }
      return std::optional<T>{std::in_place,
                              std::move(state->items[state->pos++])};
    }};
  }

  template <typename T>
  Stream<T> once(T value) {
    std::vector<T> items;
    items.emplace_back(std::move(value));
    return fromVector(std::move(items));
  }

  /**
   * Infinite stream `seed, step(seed), step(step(seed)), ...`
   */
  template <typename T, typename F>
  Stream<T> iterate(T seed, F step) {
    auto state = std::make_shared<T>(std::move(seed));
    return Stream<T>{[state, step]() -> outcome::result<std::optional<T>> {
      auto value = *state;
      *state = step(*state);
      return std::optional<T>{std::in_place, std::move(value)};
    }};
  }

  /**
   * Elements of `head`, then elements of `tail`
   */
  template <typename T>
  Stream<T> concat(Stream<T> head, Stream<T> tail) {
    struct State {
      Stream<T> head;
      Stream<T> tail;
      bool head_done = false;
    };
    auto state =
        std::make_shared<State>(State{std::move(head), std::move(tail)});
    return Stream<T>{[state]() -> outcome::result<std::optional<T>> {
      if (not state->head_done) {
        OUTCOME_TRY(item, state->head.next());
        if (item.has_value()) {
          return item;
        }
        state->head_done = true;
      }
      return state->tail.next();
    }};
  }

  template <typename T, typename F>
  auto map(Stream<T> source, F f) {
    using U = std::invoke_result_t<F &, T>;
    auto state = std::make_shared<Stream<T>>(std::move(source));
    return Stream<U>{[state, f]() mutable -> outcome::result<std::optional<U>> {
      OUTCOME_TRY(item, state->next());
      if (not item.has_value()) {
        return std::optional<U>{};
      }
      return std::optional<U>{std::in_place, f(std::move(*item))};
    }};
  }

  /**
   * Elements up to, not including, the first one failing `predicate`. The
   * source is not pulled after that.
   */
  template <typename T, typename P>
  Stream<T> takeWhile(Stream<T> source, P predicate) {
    struct State {
      Stream<T> source;
      bool done = false;
    };
    auto state = std::make_shared<State>(State{std::move(source)});
    return Stream<T>{
        [state, predicate]() -> outcome::result<std::optional<T>> {
          if (state->done) {
            return std::optional<T>{};
          }
          OUTCOME_TRY(item, state->source.next());
          if (not item.has_value() or not predicate(*item)) {
            state->done = true;
            return std::optional<T>{};
          }
          return item;
        }};
  }

  /**
   * First `count` elements. The source is not pulled after that.
   */
  template <typename T>
  Stream<T> take(Stream<T> source, size_t count) {
    struct State {
      Stream<T> source;
      size_t left;
    };
    auto state = std::make_shared<State>(State{std::move(source), count});
    return Stream<T>{[state]() -> outcome::result<std::optional<T>> {
      if (state->left == 0) {
        return std::optional<T>{};
      }
      --state->left;
      return state->source.next();
    }};
  }

  /**
   * Values of the present elements, empty elements are skipped
   */
  template <typename T>
  Stream<T> catOptionals(Stream<std::optional<T>> source) {
    auto state = std::make_shared<Stream<std::optional<T>>>(std::move(source));
    return Stream<T>{[state]() -> outcome::result<std::optional<T>> {
      while (true) {
        OUTCOME_TRY(item, state->next());
        if (not item.has_value()) {
          return std::optional<T>{};
        }
        if (item->has_value()) {
          return std::optional<T>{std::in_place, std::move(**item)};
        }
      }
    }};
  }

  /**
   * Pulls the whole stream. Never returns for an infinite one.
   */
  template <typename T>
  outcome::result<std::vector<T>> toVector(Stream<T> source) {
    std::vector<T> result;
    while (true) {
      OUTCOME_TRY(item, source.next());
      if (not item.has_value()) {
        return result;
      }
      result.emplace_back(std::move(*item));
    }
  }

  /**
   * Pulls the whole stream discarding the elements.
   * @return number of elements
   */
  template <typename T>
  outcome::result<size_t> drain(Stream<T> source) {
    size_t count = 0;
    while (true) {
      OUTCOME_TRY(item, source.next());
      if (not item.has_value()) {
        return count;
      }
      ++count;
    }
  }

}  // namespace ratemon::stream
